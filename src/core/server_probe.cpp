#include "server_probe.h"
#include "download_error.h"
#include "logger.h"

#include <cctype>
#include <limits>

int64_t parseContentLength(const std::string& value)
{
    auto start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return -1;
    auto end = value.find_last_not_of(" \t");

    int64_t result = 0;
    for (size_t i = start; i <= end; ++i) {
        unsigned char c = static_cast<unsigned char>(value[i]);
        if (!std::isdigit(c)) return -1;
        int digit = c - '0';
        if (result > (std::numeric_limits<int64_t>::max() - digit) / 10) return -1;
        result = result * 10 + digit;
    }
    return result;
}

int64_t probeSize(const Target& target, const HttpConfig& config)
{
    HeadResponse response;
    try {
        HttpEngine engine;
        response = engine.head(target.url, config);
    } catch (const HttpError& e) {
        throw DownloadError(ErrorKind::SizeUnavailable,
                            "Cannot determine size of " + target.url + ": " + e.what());
    }

    if (response.status != 200) {
        throw DownloadError(ErrorKind::SizeUnavailable,
                            "File doesn't exist on server (HTTP "
                            + std::to_string(response.status) + ")",
                            response.status);
    }

    if (!response.content_length) {
        throw DownloadError(ErrorKind::SizeUnavailable,
                            "Server did not report Content-Length", response.status);
    }

    int64_t size = parseContentLength(*response.content_length);
    if (size < 0) {
        throw DownloadError(ErrorKind::SizeUnavailable,
                            "Invalid Content-Length: '" + *response.content_length + "'",
                            response.status);
    }

    Logger::instance().info("Size of " + target.url + ": " + std::to_string(size) + " bytes");
    return size;
}

bool checkRangeSupport(const Target& target, const HttpConfig& config)
{
    long status = 0;
    try {
        HttpEngine engine;
        // Stop reading after one byte; a server that ignores the range would
        // otherwise stream the whole file.
        status = engine.get(target.url, 0, 0, config,
            [](const char*, size_t size) -> size_t {
                return size > 1 ? 0 : size;
            });
    } catch (const HttpError& e) {
        throw DownloadError(ErrorKind::FetchError,
                            "Range probe failed for " + target.url + ": " + e.what(),
                            e.httpStatus());
    }

    Logger::instance().info("Range probe for " + target.url + " returned HTTP "
        + std::to_string(status));
    return status == 206;
}
