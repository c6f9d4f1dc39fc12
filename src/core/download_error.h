#pragma once

#include <stdexcept>
#include <string>

/// Every failure a download can end with. All of them are terminal.
enum class ErrorKind {
    ParameterError,
    DestinationExists,
    SizeUnavailable,
    RangeUnsupported,
    InvalidPlanParameters,
    FetchError,
    WriteError
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParameterError:        return "ParameterError";
        case ErrorKind::DestinationExists:     return "DestinationExists";
        case ErrorKind::SizeUnavailable:       return "SizeUnavailable";
        case ErrorKind::RangeUnsupported:      return "RangeUnsupported";
        case ErrorKind::InvalidPlanParameters: return "InvalidPlanParameters";
        case ErrorKind::FetchError:            return "FetchError";
        case ErrorKind::WriteError:            return "WriteError";
    }
    return "Unknown";
}

/// Exception thrown by every core component.
class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& what, long http_status = 0)
        : std::runtime_error(what),
          kind_(kind),
          http_status_(http_status) {}

    ErrorKind kind() const noexcept { return kind_; }

    /// HTTP status that caused the error, 0 when none was received.
    long httpStatus() const noexcept { return http_status_; }

private:
    ErrorKind kind_;
    long http_status_;
};
