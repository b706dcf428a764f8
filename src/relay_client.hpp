#pragma once

#include <asio.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "log.hpp"
#include "protocol.hpp"

enum class ConnectionState { Idle, Connecting, Connected, Error };
const char* to_string(ConnectionState state);

struct ConnectionStatus {
  ConnectionState state = ConnectionState::Idle;
  std::string message; // set for Error
};

// Outbound side the sender writes to. Implementations may block in emit to
// apply back-pressure.
class TransferChannel {
public:
  virtual ~TransferChannel() = default;
  virtual bool connected() const = 0;
  virtual bool emit(const RelayMessage& message, std::string& error) = 0;
};

struct RelayEndpoint {
  std::string host;
  uint16_t port = kDefaultRelayPort;
};

// Accepts "host", "host:port", "[v6]:port" and the same with a tcp://,
// http:// or https:// prefix and a trailing slash.
std::optional<RelayEndpoint> parse_relay_endpoint(const std::string& text, std::string& error);

class RelayClient : public TransferChannel {
public:
  struct Options {
    std::string endpoint = "127.0.0.1:3000";
    std::chrono::milliseconds connect_timeout{10000};
    std::size_t high_water_bytes = std::size_t{64} * 1024 * 1024;
    std::size_t max_message_bytes = kMaxMessageBytes;
    bool transfer_debug = false;
  };

  using StatusListener = std::function<void(const ConnectionStatus&)>;
  // Runs on the client's io thread. Set both before connect().
  using MessageHandler = std::function<void(RelayMessage message)>;

  explicit RelayClient(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~RelayClient() override;

  RelayClient(const RelayClient&) = delete;
  RelayClient& operator=(const RelayClient&) = delete;

  void set_status_listener(StatusListener listener);
  void set_message_handler(MessageHandler handler);

  // Blocks until connected or failed. connect_timeout bounds the wait.
  bool connect(std::string& error);
  // Waits for every queued line to reach the socket. False on timeout or loss.
  bool flush(std::chrono::milliseconds timeout);
  void stop();

  bool join(const std::string& room_id, std::string& error);
  bool leave(const std::string& room_id, std::string& error);

  bool connected() const override;
  bool emit(const RelayMessage& message, std::string& error) override;

  ConnectionStatus status() const;
  std::size_t queued_bytes() const;
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  using tcp = asio::ip::tcp;

  void set_status(ConnectionState state, std::string message = std::string());
  void do_read();
  void do_write();
  void fail(const std::string& reason);

  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  tcp::resolver resolver_;
  tcp::socket socket_;
  asio::steady_timer connect_timer_;
  asio::streambuf read_buf_;
  std::deque<std::string> write_queue_; // io thread only

  mutable std::mutex status_mutex_;
  ConnectionStatus status_;
  StatusListener status_listener_;
  MessageHandler message_handler_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::size_t queued_bytes_ = 0;
  bool open_ = false;
  bool stopping_ = false;
};
