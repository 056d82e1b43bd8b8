/**
 * @file health_server.cpp
 * @brief HTTP status endpoint implementation
 */

#include <egress/microservice/health_server.hpp>
#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <sstream>

namespace egress::microservice {

namespace {

constexpr size_t kMaxRequestSize = 8192;

void close_socket(int fd) {
    if (fd == -1) return;
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
}

std::string make_response(int code, const char* reason, const std::string& content_type, const std::string& body) {
    std::ostringstream out;
    out << "HTTP/1.0 " << code << ' ' << reason << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << body;
    return out.str();
}

} // namespace

HealthServer::HealthServer(int port, StatusProvider provider)
    : port_(port), provider_(std::move(provider)) {
}

HealthServer::~HealthServer() noexcept {
    stop();
}

bool HealthServer::start() {
    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("[HealthServer] Failed to create socket");
        server_fd_ = -1;
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("[HealthServer] Failed to bind port {}", port_);
        close_socket(server_fd_);
        server_fd_ = -1;
        return false;
    }
    if (::listen(server_fd_, SOMAXCONN) < 0) {
        spdlog::error("[HealthServer] Failed to listen on port {}", port_);
        close_socket(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_.store(ntohs(bound.sin_port), std::memory_order_release);
    }

    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread(&HealthServer::accept_loop, this);
    spdlog::info("[HealthServer] Status endpoint listening on port {}", bound_port());
    return true;
}

void HealthServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    // Closing the listening socket unblocks accept()
    close_socket(server_fd_);
    server_fd_ = -1;
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    spdlog::info("[HealthServer] Stopped. Requests served: {}", requests_served_.load());
}

void HealthServer::accept_loop() {
    while (running_.load(std::memory_order_acquire)) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        int client_fd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (running_.load(std::memory_order_acquire)) {
                spdlog::warn("[HealthServer] accept() failed");
            }
            continue;
        }
        handle_client(client_fd);
        close_socket(client_fd);
    }
}

void HealthServer::handle_client(int client_fd) {
    // A stalled client must not block the endpoint
    timeval tv{};
    tv.tv_sec = 2;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string request;
    char buf[1024];
    while (request.find("\r\n\r\n") == std::string::npos && request.size() < kMaxRequestSize) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        request.append(buf, static_cast<size_t>(n));
    }
    if (request.empty()) {
        return;
    }

    std::string response = respond(request);
    size_t sent = 0;
    while (sent < response.size()) {
        ssize_t n = ::send(client_fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            spdlog::debug("[HealthServer] Client went away mid-response");
            return;
        }
        sent += static_cast<size_t>(n);
    }
    requests_served_.fetch_add(1, std::memory_order_relaxed);
}

std::string HealthServer::respond(const std::string& raw_request) const {
    std::istringstream in(raw_request);
    std::string method;
    std::string target;
    in >> method >> target;

    if (method.empty() || target.empty()) {
        return make_response(400, "Bad Request", "text/plain", "bad request\n");
    }
    if (method != "GET") {
        return make_response(405, "Method Not Allowed", "text/plain", "method not allowed\n");
    }

    // Ignore any query string
    auto query = target.find('?');
    if (query != std::string::npos) {
        target.erase(query);
    }
    if (target != "/") {
        return make_response(404, "Not Found", "text/plain", "not found\n");
    }

    try {
        return make_response(200, "OK", "application/json", provider_());
    } catch (const std::exception& e) {
        spdlog::error("[HealthServer] Status provider failed: {}", e.what());
        return make_response(500, "Internal Server Error", "text/plain", "status unavailable\n");
    }
}

} // namespace egress::microservice
