// Repository: Rollups-advance-runner
// Component: Metrics HTTP Server
// Purpose: Serves /metrics (Prometheus text) and /healthz over plain HTTP.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_TELEMETRY_METRICS_HTTP_SERVER_HPP_
#define ROLLUPS_TELEMETRY_METRICS_HTTP_SERVER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace rollups::telemetry {

// One accept thread, one request per connection, then close. Enough for a
// Prometheus scraper and a liveness probe.
//
// Usage:
// 1. Construct with port (0 picks an ephemeral port) and the two callbacks
// 2. Start(); Port() then reports the bound port
// 3. Stop() (or destructor) joins the accept thread
class MetricsHttpServer {
 public:
  using TextProvider = std::function<std::string()>;
  using HealthProvider = std::function<bool()>;

  MetricsHttpServer(uint16_t port, TextProvider metrics, HealthProvider healthy);
  ~MetricsHttpServer();

  MetricsHttpServer(const MetricsHttpServer&) = delete;
  MetricsHttpServer& operator=(const MetricsHttpServer&) = delete;

  // Binds 0.0.0.0:port. Throws std::runtime_error when the socket cannot be
  // bound.
  void Start();
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  uint16_t Port() const { return bound_port_.load(std::memory_order_acquire); }

  // Status line plus body for a request target. Exposed for tests.
  std::string HandleRequest(const std::string& method, const std::string& path) const;

 private:
  void AcceptLoop();
  void ServeClient(int client_fd) const;

  uint16_t port_;
  TextProvider metrics_;
  HealthProvider healthy_;

  int listen_fd_ = -1;
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::thread accept_thread_;
};

}  // namespace rollups::telemetry

#endif  // ROLLUPS_TELEMETRY_METRICS_HTTP_SERVER_HPP_
