#include "target.h"
#include "download_error.h"

#include <memory>
#include <curl/curl.h>

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};

/// Fetch one URL part; returns an empty string when the part is absent.
std::string urlPart(CURLU* h, CURLUPart what, unsigned int flags = 0) {
    char* part = nullptr;
    CURLUcode rc = curl_url_get(h, what, &part, flags);
    if (rc != CURLUE_OK || !part) {
        return {};
    }
    std::string value(part);
    curl_free(part);
    return value;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

Target parseTarget(const std::string& url)
{
    std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
    if (!handle) {
        throw DownloadError(ErrorKind::ParameterError, "Out of memory parsing URL");
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw DownloadError(ErrorKind::ParameterError, "Invalid URL: " + url);
    }

    Target target;
    target.scheme = urlPart(handle.get(), CURLUPART_SCHEME);
    if (target.scheme != "http" && target.scheme != "https") {
        throw DownloadError(ErrorKind::ParameterError,
                            "Unsupported URL scheme '" + target.scheme + "': " + url);
    }

    target.host = urlPart(handle.get(), CURLUPART_HOST);
    if (target.host.empty()) {
        throw DownloadError(ErrorKind::ParameterError, "URL has no host: " + url);
    }

    std::string port = urlPart(handle.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
    target.port = port.empty() ? 0 : std::stoi(port);

    target.path = urlPart(handle.get(), CURLUPART_PATH);
    if (target.path.empty()) {
        target.path = "/";
    }

    // Request URL without user info or fragment.
    target.url = target.scheme + "://" + target.host;
    if (!urlPart(handle.get(), CURLUPART_PORT).empty()) {
        target.url += ":" + port;
    }
    target.url += target.path;

    std::string query = urlPart(handle.get(), CURLUPART_QUERY);
    if (!query.empty()) {
        target.url += "?" + query;
    }

    return target;
}

std::string fileNameFromPath(const std::string& path)
{
    auto slash_pos = path.rfind('/');
    std::string last = (slash_pos == std::string::npos) ? path : path.substr(slash_pos + 1);
    return urlDecode(last);
}

std::string urlDecode(const std::string& encoded)
{
    std::string result;
    result.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            int h = hexValue(encoded[i + 1]);
            int l = hexValue(encoded[i + 2]);
            if (h >= 0 && l >= 0) {
                result += static_cast<char>((h << 4) | l);
                i += 2;
                continue;
            }
        }
        result += encoded[i];
    }
    return result;
}
