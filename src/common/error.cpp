// =============================================================================
// qzbulk - Error Handling Framework Implementation
// =============================================================================

#include "qzb/common/error.h"

#include <format>
#include <sstream>

namespace qzb {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!library.empty()) {
        oss << "library: " << library;
        hasContent = true;
    }

    if (!path.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "path: " << path;
        hasContent = true;
    }

    if (!entry.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "entry: " << entry;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// QZBException Implementation
// =============================================================================

void QZBException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kRemoteError:
            throw RemoteError(RemoteErrorKind::kOther, message_);
        case ErrorCode::kConnectionError:
            throw ConnectionError(message_);
        case ErrorCode::kEnumerationError:
            throw EnumerationError(message_);
        default:
            break;
    }
    throw QZBException(code_, message_);
}

}  // namespace qzb
