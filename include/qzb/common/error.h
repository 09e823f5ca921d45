// =============================================================================
// qzbulk - Error Handling Framework
// =============================================================================
// Error handling for the qzbulk library.
//
// This module provides:
// - ErrorCode enum classifying failures
// - QZBException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (library, path, archive entry) and message support
//
// Exceptions are used for I/O and remote failures. Result is used for
// validation paths that callers are expected to branch on.
//
// Naming Conventions (project style guide):
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef QZB_COMMON_ERROR_H
#define QZB_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace qzb {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error categories.
/// @note Not process exit codes; see ExitStatus in types.h for those.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief Local I/O error (file not found, read/write failure, ...).
    kIOError = 2,

    /// @brief Malformed data (archive entry name, tar header, XML payload).
    kFormatError = 3,

    /// @brief The remote database rejected or failed a request.
    kRemoteError = 4,

    /// @brief No connection to the remote database could be established.
    kConnectionError = 5,

    /// @brief Job enumeration failed before any transfer started.
    kEnumerationError = 6,

    /// @brief Invalid argument value.
    kInvalidArgument = 7,

    /// @brief Invalid state for operation.
    kInvalidState = 8,

    /// @brief Operation was cancelled.
    kCancelled = 9,

    /// @brief Unsupported compression or archive format.
    kUnsupportedFormat = 10
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kRemoteError:
            return "remote error";
        case ErrorCode::kConnectionError:
            return "connection error";
        case ErrorCode::kEnumerationError:
            return "enumeration error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kUnsupportedFormat:
            return "unsupported format";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Library the failing operation addressed (if applicable).
    std::string library;

    /// @brief Document or collection path (if applicable).
    std::string path;

    /// @brief Archive entry name or local file path (if applicable).
    std::string entry;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    ErrorContext& withLibrary(std::string name) {
        library = std::move(name);
        return *this;
    }

    ErrorContext& withPath(std::string value) {
        path = std::move(value);
        return *this;
    }

    ErrorContext& withEntry(std::string name) {
        entry = std::move(name);
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all qzbulk errors.
/// @note Provides error code, message, and optional context.
class QZBException : public std::exception {
public:
    QZBException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    QZBException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~QZBException() override = default;

    QZBException(const QZBException&) = default;
    QZBException(QZBException&&) noexcept = default;
    QZBException& operator=(const QZBException&) = default;
    QZBException& operator=(QZBException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors.
class UsageError : public QZBException {
public:
    explicit UsageError(std::string message)
        : QZBException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : QZBException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for local I/O errors.
/// @note Thrown for archive files and directories that cannot be opened,
///       read or written.
class IOError : public QZBException {
public:
    explicit IOError(std::string message)
        : QZBException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : QZBException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : QZBException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : QZBException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed data.
/// @note Thrown for invalid archive entry names, corrupt tar archives and
///       XML payloads that cannot be parsed.
class FormatError : public QZBException {
public:
    explicit FormatError(std::string message)
        : QZBException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : QZBException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Classification of failures reported by the remote database.
enum class RemoteErrorKind : std::uint8_t {
    kBadRequest = 0,
    kServer,
    kNotFound,
    kAccessControl,
    kXmlData,
    kCompilation,
    kEvaluation,
    kTimeout,
    kImport,
    kUnexpectedResponse,
    kHttpStatus,
    kOther
};

/// @brief Convert RemoteErrorKind to string.
[[nodiscard]] constexpr std::string_view remoteErrorKindToString(RemoteErrorKind kind) noexcept {
    switch (kind) {
        case RemoteErrorKind::kBadRequest: return "bad request";
        case RemoteErrorKind::kServer: return "server";
        case RemoteErrorKind::kNotFound: return "not found";
        case RemoteErrorKind::kAccessControl: return "access denied";
        case RemoteErrorKind::kXmlData: return "XML data";
        case RemoteErrorKind::kCompilation: return "compilation";
        case RemoteErrorKind::kEvaluation: return "evaluation";
        case RemoteErrorKind::kTimeout: return "timeout";
        case RemoteErrorKind::kImport: return "import";
        case RemoteErrorKind::kUnexpectedResponse: return "unexpected response";
        case RemoteErrorKind::kHttpStatus: return "HTTP status";
        case RemoteErrorKind::kOther: return "other";
    }
    return "other";
}

/// @brief Exception for failures reported by the remote database.
class RemoteError : public QZBException {
public:
    RemoteError(RemoteErrorKind kind, std::string message)
        : QZBException(ErrorCode::kRemoteError, std::move(message)), kind_(kind) {}

    RemoteError(RemoteErrorKind kind, std::string message, ErrorContext context)
        : QZBException(ErrorCode::kRemoteError, std::move(message), std::move(context)),
          kind_(kind) {}

    /// @brief Construct from an HTTP status code.
    RemoteError(long httpStatus, std::string message, ErrorContext context)
        : QZBException(ErrorCode::kRemoteError, std::move(message), std::move(context)),
          kind_(RemoteErrorKind::kHttpStatus),
          httpStatus_(httpStatus) {}

    [[nodiscard]] RemoteErrorKind kind() const noexcept { return kind_; }

    /// @brief HTTP status, when the failure came from the transport layer.
    [[nodiscard]] std::optional<long> httpStatus() const noexcept { return httpStatus_; }

private:
    RemoteErrorKind kind_;
    std::optional<long> httpStatus_;
};

/// @brief Exception for failures to reach the remote database.
class ConnectionError : public QZBException {
public:
    explicit ConnectionError(std::string message)
        : QZBException(ErrorCode::kConnectionError, std::move(message)) {}

    ConnectionError(std::string message, ErrorContext context)
        : QZBException(ErrorCode::kConnectionError, std::move(message), std::move(context)) {}
};

/// @brief Exception for failures while enumerating jobs.
/// @note Fatal: the run stops before any job of the affected library is queued.
class EnumerationError : public QZBException {
public:
    explicit EnumerationError(std::string message)
        : QZBException(ErrorCode::kEnumerationError, std::move(message)) {}

    EnumerationError(std::string message, ErrorContext context)
        : QZBException(ErrorCode::kEnumerationError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    explicit Error(const QZBException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

}  // namespace qzb

#endif  // QZB_COMMON_ERROR_H
