#include "http_engine.h"

#include <cctype>
#include <mutex>
#include <curl/curl.h>

namespace {

std::once_flag g_curl_init_once;

void ensureCurlGlobalInit() {
    std::call_once(g_curl_init_once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw HttpError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc),
                            static_cast<int>(rc));
        }
    });
}

} // anonymous namespace

// ── Pimpl ──────────────────────────────────────────────────────

struct HttpEngine::Impl {
    CURL* curl = nullptr;

    Impl() {
        ensureCurlGlobalInit();
        curl = curl_easy_init();
        if (!curl) {
            throw HttpError("Failed to initialise CURL easy handle");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    void reset() {
        curl_easy_reset(curl);
    }

    // ── Common configuration applied to every request ──────────
    void applyConfig(const HttpConfig& config) {
        if (!config.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
        }

        // One private connection per request: never reuse, never keep.
        curl_easy_setopt(curl, CURLOPT_FRESH_CONNECT, 1L);
        curl_easy_setopt(curl, CURLOPT_FORBID_REUSE, 1L);

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config.connect_timeout_sec > 0)
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config.connect_timeout_sec));
        if (config.transfer_timeout_sec > 0)
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config.transfer_timeout_sec));
    }

    long responseCode() const {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        return http_code;
    }
};

// ── Static helpers ─────────────────────────────────────────────

namespace {

/// Trim leading/trailing whitespace.
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

/// Case-insensitive header name comparison.
bool headerNameEquals(const std::string& header, const std::string& name) {
    if (header.size() != name.size()) return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) !=
            std::tolower(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    return true;
}

// ── HEAD-request header callback ───────────────────────────────

size_t headHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* response = static_cast<HeadResponse*>(userdata);
    std::string line(buffer, total);

    // A new status line starts a new header block (e.g. after 1xx).
    if (line.compare(0, 5, "HTTP/") == 0) {
        response->content_length.reset();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return total;

    if (headerNameEquals(trim(line.substr(0, colon)), "Content-Length")) {
        response->content_length = trim(line.substr(colon + 1));
    }
    return total;
}

// ── GET write callback ─────────────────────────────────────────

struct GetContext {
    DataCallback on_data;
    bool stopped_by_caller = false;
};

size_t getWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<GetContext*>(userdata);
    size_t total = size * nmemb;

    if (!ctx->on_data) {
        return total;  // discard
    }

    size_t consumed = ctx->on_data(ptr, total);
    if (consumed < total) {
        ctx->stopped_by_caller = true;  // returning short aborts the transfer
    }
    return consumed;
}

} // anonymous namespace

// ── HttpEngine public API ──────────────────────────────────────

HttpEngine::HttpEngine() : impl_(std::make_unique<Impl>()) {}

HttpEngine::~HttpEngine() = default;

HeadResponse HttpEngine::head(const std::string& url, const HttpConfig& config) {
    impl_->reset();
    CURL* curl = impl_->curl;

    HeadResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headHeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
    impl_->applyConfig(config);

    CURLcode res = curl_easy_perform(curl);
    long http_code = impl_->responseCode();

    if (res != CURLE_OK) {
        throw HttpError(std::string("HEAD request failed: ") + curl_easy_strerror(res),
                        static_cast<int>(res), http_code);
    }

    response.status = http_code;
    return response;
}

long HttpEngine::get(const std::string& url,
                     int64_t range_start,
                     int64_t range_end,
                     const HttpConfig& config,
                     DataCallback on_data) {
    impl_->reset();
    CURL* curl = impl_->curl;

    GetContext ctx;
    ctx.on_data = std::move(on_data);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, getWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    std::string range = std::to_string(range_start) + "-" + std::to_string(range_end);
    curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());

    impl_->applyConfig(config);

    CURLcode res = curl_easy_perform(curl);
    long http_code = impl_->responseCode();

    // Stopping early from on_data is not a transport failure once the
    // status line has arrived.
    if (res == CURLE_WRITE_ERROR && ctx.stopped_by_caller && http_code > 0) {
        return http_code;
    }

    if (res != CURLE_OK) {
        throw HttpError(std::string("GET request failed: ") + curl_easy_strerror(res),
                        static_cast<int>(res), http_code);
    }

    return http_code;
}
