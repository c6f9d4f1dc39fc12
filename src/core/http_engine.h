#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

/// Result of a HEAD request.
struct HeadResponse {
    long status = 0;
    std::optional<std::string> content_length;  // raw header value, unparsed
};

/// Per-request HTTP configuration.
struct HttpConfig {
    int connect_timeout_sec = 0;    // 0 = libcurl default
    int transfer_timeout_sec = 0;   // 0 = no total transfer timeout
    std::string user_agent = "mget/1.0";
};

/// Data callback: receives a piece of the body, returns bytes consumed.
using DataCallback = std::function<size_t(const char* data, size_t size)>;

/// Exception thrown on transport errors.
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what,
                       int curl_code = 0,
                       long http_status = 0)
        : std::runtime_error(what),
          curl_code_(curl_code),
          http_status_(http_status) {}

    int curlCode() const noexcept { return curl_code_; }
    long httpStatus() const noexcept { return http_status_; }

private:
    int curl_code_;
    long http_status_;
};

/// Synchronous HTTP engine wrapping a libcurl easy handle (Pimpl).
/// Each instance owns one CURL handle and opens a fresh connection for every
/// request; redirects are never followed. Not thread-safe; use one per thread.
class HttpEngine {
public:
    HttpEngine();
    ~HttpEngine();

    HttpEngine(const HttpEngine&) = delete;
    HttpEngine& operator=(const HttpEngine&) = delete;

    /// Send a HEAD request and return its status and Content-Length.
    HeadResponse head(const std::string& url, const HttpConfig& config);

    /// GET the inclusive byte window [range_start, range_end].
    /// The body is delivered through on_data; returns the HTTP status.
    /// If on_data consumes fewer bytes than offered the transfer stops early
    /// and the status is still returned.
    long get(const std::string& url,
             int64_t range_start,
             int64_t range_end,
             const HttpConfig& config,
             DataCallback on_data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
