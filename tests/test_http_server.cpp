// test_http_server.cpp
#include "test_http_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace {

/// Best effort: a client that stops reading early (range probe) is not an error.
void sendAll(int fd, const std::string& data) {
    const char* ptr = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t sent = ::send(fd, ptr, left, MSG_NOSIGNAL);
        if (sent <= 0) return;
        ptr += sent;
        left -= static_cast<size_t>(sent);
    }
}

const char* reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 404: return "Not Found";
        case 416: return "Range Not Satisfiable";
        case 500: return "Internal Server Error";
        default:  return "Status";
    }
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Parse "bytes=a-b" into [a, b]. Suffix and open ranges are not needed here.
bool parseRange(const std::string& value, int64_t& start, int64_t& end) {
    const std::string prefix = "bytes=";
    if (value.compare(0, prefix.size(), prefix) != 0) return false;
    std::string spec = value.substr(prefix.size());
    auto dash = spec.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 >= spec.size()) return false;
    char* endp = nullptr;
    start = std::strtoll(spec.c_str(), &endp, 10);
    if (endp != spec.c_str() + dash) return false;
    end = std::strtoll(spec.c_str() + dash + 1, &endp, 10);
    if (*endp != '\0') return false;
    return start >= 0 && end >= start;
}

} // anonymous namespace

std::string makeTestContent(size_t size) {
    std::string out(size, '\0');
    uint32_t state = 0x2545F491u;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1664525u + 1013904223u;
        out[i] = static_cast<char>(state >> 24);
    }
    return out;
}

// ── Lifecycle ──────────────────────────────────────────────────

TestHttpServer::TestHttpServer(Options options)
    : options_(std::move(options))
{
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("TestHttpServer: socket() failed");
    }

    int yes = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;   // ephemeral
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(listen_fd_, 64) < 0) {
        ::close(listen_fd_);
        throw std::runtime_error("TestHttpServer: bind/listen failed");
    }

    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    accept_thread_ = std::thread([this] { acceptLoop(); });
}

TestHttpServer::~TestHttpServer() {
    stopping_.store(true);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    ::close(listen_fd_);

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(connection_threads_);
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}

std::string TestHttpServer::url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
}

std::vector<TestHttpServer::Request> TestHttpServer::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

size_t TestHttpServer::requestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

// ── Serving ────────────────────────────────────────────────────

void TestHttpServer::acceptLoop() {
    while (!stopping_.load()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, 50);
        if (rc <= 0) continue;

        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) continue;

        std::lock_guard<std::mutex> lock(mutex_);
        connection_threads_.emplace_back([this, fd] { handleConnection(fd); });
    }
}

void TestHttpServer::handleConnection(int fd) {
    std::string raw;
    char buf[4096];
    while (raw.find("\r\n\r\n") == std::string::npos && raw.size() < 65536) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        raw.append(buf, static_cast<size_t>(n));
    }

    auto line_end = raw.find("\r\n");
    if (line_end == std::string::npos) {
        ::close(fd);
        return;
    }

    Request request;
    std::string request_line = raw.substr(0, line_end);
    auto sp1 = request_line.find(' ');
    auto sp2 = request_line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos) {
        ::close(fd);
        return;
    }
    request.method = request_line.substr(0, sp1);
    request.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);

    size_t pos = line_end + 2;
    while (pos < raw.size()) {
        auto next = raw.find("\r\n", pos);
        if (next == std::string::npos || next == pos) break;
        std::string header = raw.substr(pos, next - pos);
        auto colon = header.find(':');
        if (colon != std::string::npos && lower(header.substr(0, colon)) == "range") {
            auto value_start = header.find_first_not_of(' ', colon + 1);
            request.range = value_start == std::string::npos ? "" : header.substr(value_start);
        }
        pos = next + 2;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }

    respond(fd, request);
    ::close(fd);
}

void TestHttpServer::respond(int fd, const Request& request) {
    const std::string& content = options_.content;
    const int64_t size = static_cast<int64_t>(content.size());

    auto reply = [fd](int status, const std::string& extra_headers, const std::string& body,
                      bool with_body) {
        std::string head = "HTTP/1.1 " + std::to_string(status) + " " + reasonPhrase(status)
            + "\r\n" + extra_headers + "Connection: close\r\n\r\n";
        sendAll(fd, with_body ? head + body : head);
    };

    if (request.method == "HEAD") {
        std::string headers;
        if (options_.head_status == 200 && options_.send_content_length) {
            headers += "Content-Length: "
                + (options_.content_length_value.empty() ? std::to_string(size)
                                                         : options_.content_length_value)
                + "\r\n";
        } else if (options_.head_status != 200) {
            headers += "Content-Length: 0\r\n";
        }
        if (options_.support_ranges) {
            headers += "Accept-Ranges: bytes\r\n";
        }
        reply(options_.head_status, headers, "", false);
        return;
    }

    if (request.method != "GET") {
        reply(404, "Content-Length: 0\r\n", "", false);
        return;
    }

    int active = ++active_gets_;
    int prev_max = max_active_gets_.load();
    while (active > prev_max && !max_active_gets_.compare_exchange_weak(prev_max, active)) {
    }

    int64_t start = 0;
    int64_t end = 0;
    if (options_.support_ranges && !request.range.empty() && parseRange(request.range, start, end)) {
        auto delay = options_.delay_ms_by_start.find(start);
        if (delay != options_.delay_ms_by_start.end()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay->second));
        }

        if (options_.fail_range_starts.count(start)) {
            reply(500, "Content-Length: 4\r\n", "boom", true);
        } else if (start >= size) {
            reply(416, "Content-Range: bytes */" + std::to_string(size)
                      + "\r\nContent-Length: 0\r\n", "", false);
        } else {
            end = std::min(end, size - 1);
            std::string body = content.substr(static_cast<size_t>(start),
                                              static_cast<size_t>(end - start + 1));
            if (options_.truncate_range_starts.count(start)) {
                body.resize(body.size() / 2);
            }
            reply(206,
                 "Content-Range: bytes " + std::to_string(start) + "-" + std::to_string(end)
                     + "/" + std::to_string(size) + "\r\n"
                     + "Content-Length: " + std::to_string(body.size()) + "\r\n",
                 body, true);
        }
    } else {
        reply(200, "Content-Length: " + std::to_string(size) + "\r\n", content, true);
    }

    --active_gets_;
}
