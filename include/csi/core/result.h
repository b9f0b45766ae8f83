#ifndef CSI_CORE_RESULT_H_
#define CSI_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include "csi/core/error.h"

namespace csi {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Carries either a value or an error message together with the
 * Error::Code that classifies it.
 *
 * Usage:
 * ```
 * Result<Row> parse(...) {
 *     if (bad) {
 *         return Result<Row>(MalformedIdentifierError("..."));
 *     }
 *     return Result<Row>(std::move(row));
 * }
 *
 * auto result = parse(...);
 * if (!result.ok()) {
 *     CSI_ERROR("{}", result.error());
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt) {}

    explicit Result(const Error& error)
        : value_(), error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : value_(), error_msg_(std::move(error_msg)), code_(code) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)),
          error_msg_(std::move(other.error_msg_)),
          code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    bool has_error() const { return error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code error_code() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error code of ok result");
        }
        return code_;
    }

    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(message, code, ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt) {}
    explicit Result(const Error& error)
        : error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}

    bool ok() const { return !error_msg_.has_value(); }
    bool has_error() const { return error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code error_code() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error code of ok result");
        }
        return code_;
    }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<void>(message, code, ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

} // namespace core
} // namespace csi

#endif // CSI_CORE_RESULT_H_
