#pragma once

#include <string>

/// Resolved remote location, derived once from the input URL.
struct Target {
    std::string url;      // request URL: scheme://host[:port]/path[?query]
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;     // raw (still percent-encoded) path, starts with '/'
};

/// Parse an http/https URL. Throws DownloadError(ParameterError) on anything
/// libcurl cannot parse, a missing host or an unsupported scheme.
Target parseTarget(const std::string& url);

/// Last segment of a URL path, percent-decoded. Empty if the path ends in '/'.
std::string fileNameFromPath(const std::string& path);

/// Decode %XX escapes; malformed escapes are kept verbatim.
std::string urlDecode(const std::string& encoded);
