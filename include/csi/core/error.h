#ifndef CSI_CORE_ERROR_H_
#define CSI_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace csi {
namespace core {

/**
 * @brief Base class for all client-side index errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        MALFORMED_IDENTIFIER = 3,
        EMPTY_INDEX_INPUT = 4
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

    static const char* code_name(Code code);

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief A row identifier that does not follow
 * `<measurement>(,<tag>)*#<field>#<YYYY-MM-DD>`.
 *
 * The backing store only holds well-formed identifiers, so this means the
 * data upstream is corrupt; callers must not build a partial index.
 */
class MalformedIdentifierError : public Error {
public:
    explicit MalformedIdentifierError(const std::string& message)
        : Error(message, Code::MALFORMED_IDENTIFIER) {}
    explicit MalformedIdentifierError(const char* message)
        : Error(message, Code::MALFORMED_IDENTIFIER) {}
};

/**
 * @brief Index construction was handed no rows
 */
class EmptyIndexInputError : public Error {
public:
    explicit EmptyIndexInputError(const std::string& message)
        : Error(message, Code::EMPTY_INDEX_INPUT) {}
    explicit EmptyIndexInputError(const char* message)
        : Error(message, Code::EMPTY_INDEX_INPUT) {}
};

} // namespace core
} // namespace csi

#endif // CSI_CORE_ERROR_H_
