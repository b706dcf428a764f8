#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "protocol.hpp"
#include "relay_hub.hpp"

class RelayConnection;
class SettingsManager;

// TCP front end of the relay. Owns the io_context, the acceptor and the hub;
// there is no process-wide instance.
class RelayService {
public:
  struct Options {
    std::size_t max_message_bytes = kMaxMessageBytes;
    std::string log_name = "relay";
  };

  RelayService(std::shared_ptr<SettingsManager> settings, Options options);
  explicit RelayService(std::shared_ptr<SettingsManager> settings);
  ~RelayService();

  // Binds listen_ip:listen_port. Throws on a bad address or a failed bind.
  void start();
  void run();
  void start_background();
  // Safe from any thread, including a signal handler on the io thread.
  void request_stop();
  void stop();

  RelayHub::Stats stats() const { return hub_->stats(); }
  std::shared_ptr<RelayHub> hub() const { return hub_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  asio::io_context& io() { return io_; }

  uint16_t listen_port() const { return listen_port_; }
  const std::string& listen_ip() const { return listen_ip_; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void close_all();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<RelayHub> hub_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::vector<std::weak_ptr<RelayConnection>> connections_; // io thread only
  bool started_ = false;
  std::atomic<bool> stopping_{false};
  std::string listen_ip_;
  uint16_t listen_port_ = 0;
};
