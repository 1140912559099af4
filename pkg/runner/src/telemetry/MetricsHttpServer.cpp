// Repository: Rollups-advance-runner
// Component: Metrics HTTP Server
// Copyright (c) 2025 Rollups

#include "rollups/telemetry/MetricsHttpServer.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "rollups/util/Logger.hpp"

namespace rollups::telemetry {

using util::Logger;

namespace {

constexpr int kAcceptPollMs = 50;
constexpr size_t kMaxRequestBytes = 8192;

std::string Response(int code, const char* reason, const std::string& content_type,
                     const std::string& body) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << code << " " << reason << "\r\n"
      << "Content-Type: " << content_type << "\r\n"
      << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n"
      << "\r\n"
      << body;
  return oss.str();
}

void SendAll(int fd, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return;  // Client went away
    }
    sent += static_cast<size_t>(n);
  }
}

}  // namespace

MetricsHttpServer::MetricsHttpServer(uint16_t port, TextProvider metrics,
                                     HealthProvider healthy)
    : port_(port), metrics_(std::move(metrics)), healthy_(std::move(healthy)) {}

MetricsHttpServer::~MetricsHttpServer() {
  Stop();
}

void MetricsHttpServer::Start() {
  if (running_.load(std::memory_order_acquire)) return;

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    throw std::runtime_error(std::string("metrics socket: ") + std::strerror(errno));
  }

  int opt = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port_);

  if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
      listen(listen_fd_, 16) < 0) {
    const std::string reason = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    throw std::runtime_error("metrics bind port " + std::to_string(port_) + ": " + reason);
  }

  socklen_t len = sizeof(addr);
  if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
    bound_port_.store(ntohs(addr.sin_port), std::memory_order_release);
  }

  // Non-blocking so the accept loop can observe Stop().
  int flags = fcntl(listen_fd_, F_GETFL, 0);
  fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  accept_thread_ = std::thread(&MetricsHttpServer::AcceptLoop, this);

  Logger::Info("[MetricsHttpServer] LISTENING port=" + std::to_string(Port()));
}

void MetricsHttpServer::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }
  running_.store(false, std::memory_order_release);
}

void MetricsHttpServer::AcceptLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        Logger::Warn(std::string("[MetricsHttpServer] ACCEPT_FAILED error=") +
                     std::strerror(errno));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptPollMs));
      continue;
    }
    ServeClient(client_fd);
    close(client_fd);
  }
}

void MetricsHttpServer::ServeClient(int client_fd) const {
  // Accepted sockets may inherit O_NONBLOCK; requests are tiny, block briefly.
  int flags = fcntl(client_fd, F_GETFL, 0);
  fcntl(client_fd, F_SETFL, flags & ~O_NONBLOCK);
  struct timeval tv;
  tv.tv_sec = 2;
  tv.tv_usec = 0;
  setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  std::string request;
  char buf[1024];
  while (request.find("\r\n") == std::string::npos && request.size() < kMaxRequestBytes) {
    ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
    if (n <= 0) break;
    request.append(buf, static_cast<size_t>(n));
  }

  const size_t line_end = request.find("\r\n");
  if (line_end == std::string::npos) {
    SendAll(client_fd, Response(400, "Bad Request", "text/plain", "bad request\n"));
    return;
  }

  // "GET /metrics HTTP/1.1"
  std::istringstream line(request.substr(0, line_end));
  std::string method;
  std::string target;
  line >> method >> target;
  const size_t query = target.find('?');
  if (query != std::string::npos) target.resize(query);

  SendAll(client_fd, HandleRequest(method, target));
}

std::string MetricsHttpServer::HandleRequest(const std::string& method,
                                             const std::string& path) const {
  if (method != "GET") {
    return Response(405, "Method Not Allowed", "text/plain", "method not allowed\n");
  }
  if (path == "/metrics") {
    return Response(200, "OK", "text/plain; version=0.0.4", metrics_ ? metrics_() : "");
  }
  if (path == "/healthz") {
    if (!healthy_ || healthy_()) {
      return Response(200, "OK", "text/plain", "ok\n");
    }
    return Response(503, "Service Unavailable", "text/plain", "failed\n");
  }
  return Response(404, "Not Found", "text/plain", "not found\n");
}

}  // namespace rollups::telemetry
