#ifndef HGRAPH_CORE_RESULT_H_
#define HGRAPH_CORE_RESULT_H_

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include "hgraph/core/error.h"

namespace hgraph {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * A failed result carries an Error::Code and a message. Absence of a
 * solution is not a failure; searches report it as an empty optional
 * inside an ok result.
 *
 * Usage:
 * ```
 * Result<Graph> build() {
 *     if (error_condition) {
 *         return Result<Graph>::error(Error::Code::IO_ERROR, "cannot open log");
 *     }
 *     return Result<Graph>(std::move(graph));
 * }
 *
 * auto result = build();
 * if (result.ok()) {
 *     Graph graph = result.take_value();
 * } else {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}

    explicit Result(std::unique_ptr<Error> error)
        : value_(),
          error_msg_(error ? std::make_optional(std::string(error->what())) : std::nullopt),
          code_(error ? error->code() : Error::Code::UNKNOWN) {}

    struct ErrorTag {};
    explicit Result(Error::Code code, std::string error_msg, ErrorTag)
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
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    /// Code of a failed result; UNKNOWN for an ok result.
    Error::Code code() const { return error_msg_ ? code_ : Error::Code::UNKNOWN; }
    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message) {
        return Result<T>(Error::Code::UNKNOWN, message, ErrorTag{});
    }

    static Result<T> error(Error::Code code, const std::string& message) {
        return Result<T>(code, message, ErrorTag{});
    }

    /// Re-raises the failure of another result as a result of this type.
    template<typename U>
    static Result<T> propagate(const Result<U>& failed) {
        return Result<T>(failed.code(), failed.error(), ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}

    explicit Result(std::unique_ptr<Error> error)
        : error_msg_(error ? std::make_optional(std::string(error->what())) : std::nullopt),
          code_(error ? error->code() : Error::Code::UNKNOWN) {}

    struct ErrorTag {};
    explicit Result(Error::Code code, std::string error_msg, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const { return error_msg_ ? code_ : Error::Code::UNKNOWN; }

    static Result<void> error(const std::string& message) {
        return Result<void>(Error::Code::UNKNOWN, message, ErrorTag{});
    }

    static Result<void> error(Error::Code code, const std::string& message) {
        return Result<void>(code, message, ErrorTag{});
    }

    template<typename U>
    static Result<void> propagate(const Result<U>& failed) {
        return Result<void>(failed.code(), failed.error(), ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

} // namespace core
} // namespace hgraph

#endif // HGRAPH_CORE_RESULT_H_
