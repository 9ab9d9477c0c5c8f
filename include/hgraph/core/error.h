#ifndef HGRAPH_CORE_ERROR_H_
#define HGRAPH_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace hgraph {
namespace core {

/**
 * @brief Base class for all hgraph errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        IO_ERROR = 2,
        PARSE_ERROR = 3,
        INVALID_CONSTRAINT = 4,
        UNSUPPORTED = 5,
        SEARCH_ABORTED = 6,
        INTERNAL = 7
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
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating the store could not be read or written
 */
class IOError : public Error {
public:
    explicit IOError(const std::string& message)
        : Error(message, Code::IO_ERROR) {}
};

/**
 * @brief Error indicating a corrupted or malformed command record
 */
class ParseError : public Error {
public:
    explicit ParseError(const std::string& message)
        : Error(message, Code::PARSE_ERROR) {}
};

/**
 * @brief Error indicating a contradictory constraint set
 */
class InvalidConstraintError : public Error {
public:
    explicit InvalidConstraintError(const std::string& message)
        : Error(message, Code::INVALID_CONSTRAINT) {}
};

/**
 * @brief Error indicating a request outside the supported envelope
 */
class UnsupportedError : public Error {
public:
    explicit UnsupportedError(const std::string& message)
        : Error(message, Code::UNSUPPORTED) {}
};

/**
 * @brief Error indicating a search stopped by its expansion budget or cancellation
 */
class SearchAbortedError : public Error {
public:
    explicit SearchAbortedError(const std::string& message)
        : Error(message, Code::SEARCH_ABORTED) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

/// Stable name of an error code, e.g. "InvalidConstraint".
const char* code_name(Error::Code code);

/**
 * @brief Process exit code reported by the CLI for an error code.
 *
 * 0 and 1 are reserved for "found" and "no solution", 2 for usage errors.
 */
int exit_code_for(Error::Code code);

} // namespace core
} // namespace hgraph

#endif // HGRAPH_CORE_ERROR_H_
