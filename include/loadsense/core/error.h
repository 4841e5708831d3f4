#ifndef LOADSENSE_CORE_ERROR_H_
#define LOADSENSE_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace loadsense {
namespace core {

/**
 * @brief Base class for all loadsense errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or configuration
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

} // namespace core
} // namespace loadsense

#endif // LOADSENSE_CORE_ERROR_H_
