#pragma once

#include <cstdint>
#include <string>

#include "http_engine.h"
#include "target.h"

/// Discover the remote size with a HEAD request.
/// Requires status 200 and a purely numeric Content-Length; anything else,
/// including a transport failure, throws DownloadError(SizeUnavailable).
int64_t probeSize(const Target& target, const HttpConfig& config);

/// Ask for the first byte only and report whether the server answered with
/// 206 Partial Content. A 200 means the range was ignored. Transport failures
/// throw DownloadError(FetchError).
bool checkRangeSupport(const Target& target, const HttpConfig& config);

/// Parse a Content-Length value: optional surrounding whitespace, then decimal
/// digits only. Returns -1 when the value is not a valid length.
int64_t parseContentLength(const std::string& value);
