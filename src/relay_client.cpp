#include "relay_client.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <istream>

#include "utils.hpp"

const char* to_string(ConnectionState state) {
  switch(state) {
    case ConnectionState::Idle: return "idle";
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Connected: return "connected";
    case ConnectionState::Error: return "error";
  }
  return "unknown";
}

std::optional<RelayEndpoint> parse_relay_endpoint(const std::string& text, std::string& error) {
  std::string s = trim_copy(text);
  for(const char* prefix : {"tcp://", "http://", "https://"}) {
    std::string p(prefix);
    if(s.size() >= p.size() && std::equal(p.begin(), p.end(), s.begin(),
         [](char a, char b){ return a == std::tolower(static_cast<unsigned char>(b)); })) {
      s.erase(0, p.size());
      break;
    }
  }
  auto slash = s.find('/');
  if(slash != std::string::npos) s.erase(slash);
  if(s.empty()) {
    error = "empty relay address";
    return std::nullopt;
  }

  RelayEndpoint ep;
  std::string port_text;
  bool has_port = false;
  if(s.front() == '[') {
    auto close = s.find(']');
    if(close == std::string::npos) {
      error = "unterminated '[' in relay address '" + text + "'";
      return std::nullopt;
    }
    ep.host = s.substr(1, close - 1);
    auto rest = s.substr(close + 1);
    if(!rest.empty()) {
      if(rest.front() != ':') {
        error = "unexpected text after ']' in relay address '" + text + "'";
        return std::nullopt;
      }
      has_port = true;
      port_text = rest.substr(1);
    }
  } else {
    auto colon = s.rfind(':');
    // More than one colon without brackets is a bare IPv6 address.
    if(colon != std::string::npos && s.find(':') == colon) {
      ep.host = s.substr(0, colon);
      has_port = true;
      port_text = s.substr(colon + 1);
    } else {
      ep.host = s;
    }
  }

  if(ep.host.empty()) {
    error = "missing host in relay address '" + text + "'";
    return std::nullopt;
  }
  if(has_port) {
    bool digits = !port_text.empty() && port_text.size() <= 5 &&
      std::all_of(port_text.begin(), port_text.end(), [](unsigned char ch){ return std::isdigit(ch); });
    unsigned long value = digits ? std::stoul(port_text) : 0;
    if(!digits || value == 0 || value > 65535) {
      error = "invalid port '" + port_text + "' in relay address '" + text + "'";
      return std::nullopt;
    }
    ep.port = static_cast<uint16_t>(value);
  }
  return ep;
}

RelayClient::RelayClient(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("client")),
    resolver_(io_),
    socket_(io_),
    connect_timer_(io_),
    read_buf_(options_.max_message_bytes == 0 ? kMaxMessageBytes : options_.max_message_bytes) {
  if(options_.connect_timeout.count() <= 0) {
    options_.connect_timeout = std::chrono::milliseconds(10000);
  }
}

RelayClient::~RelayClient() {
  stop();
}

void RelayClient::set_status_listener(StatusListener listener) {
  std::lock_guard lg(status_mutex_);
  status_listener_ = std::move(listener);
}

void RelayClient::set_message_handler(MessageHandler handler) {
  std::lock_guard lg(status_mutex_);
  message_handler_ = std::move(handler);
}

ConnectionStatus RelayClient::status() const {
  std::lock_guard lg(status_mutex_);
  return status_;
}

void RelayClient::set_status(ConnectionState state, std::string message) {
  StatusListener listener;
  ConnectionStatus current;
  {
    std::lock_guard lg(status_mutex_);
    status_.state = state;
    status_.message = std::move(message);
    current = status_;
    listener = status_listener_;
  }
  if(listener) listener(current);
}

bool RelayClient::connected() const {
  std::lock_guard lg(queue_mutex_);
  return open_;
}

std::size_t RelayClient::queued_bytes() const {
  std::lock_guard lg(queue_mutex_);
  return queued_bytes_;
}

bool RelayClient::connect(std::string& error) {
  auto endpoint = parse_relay_endpoint(options_.endpoint, error);
  if(!endpoint) {
    set_status(ConnectionState::Error, error);
    return false;
  }
  {
    auto current = status().state;
    if(current == ConnectionState::Connecting || current == ConnectionState::Connected) {
      error = "already connected";
      return false;
    }
  }
  {
    std::lock_guard lg(queue_mutex_);
    stopping_ = false;
    queued_bytes_ = 0;
  }

  set_status(ConnectionState::Connecting);
  logger_->info("Connecting to relay {}:{}", endpoint->host, endpoint->port);

  if(!io_thread_.joinable()) {
    io_.restart();
    work_.emplace(asio::make_work_guard(io_));
    io_thread_ = std::thread([this](){
      io_.run();
    });
  }

  auto done = std::make_shared<std::promise<std::error_code>>();
  auto result = done->get_future();
  auto settled = std::make_shared<bool>(false); // io thread only

  auto finish = [this, done, settled](std::error_code ec){
    *settled = true;
    connect_timer_.cancel();
    if(ec) {
      std::error_code ignored;
      resolver_.cancel();
      socket_.close(ignored);
    }
    done->set_value(ec);
  };

  asio::post(io_, [this, ep = *endpoint, finish, settled](){
    connect_timer_.expires_after(options_.connect_timeout);
    connect_timer_.async_wait([finish, settled](std::error_code ec){
      if(ec || *settled) return;
      finish(asio::error::timed_out);
    });
    resolver_.async_resolve(ep.host, std::to_string(ep.port),
      [this, finish, settled](std::error_code ec, tcp::resolver::results_type results){
        if(*settled) return;
        if(ec) {
          finish(ec);
          return;
        }
        asio::async_connect(socket_, results,
          [this, finish, settled](std::error_code ec, const tcp::endpoint& remote){
            if(*settled) return;
            if(!ec) {
              std::error_code ignored;
              socket_.set_option(tcp::no_delay(true), ignored);
              {
                std::lock_guard lg(queue_mutex_);
                open_ = true;
              }
              logger_->info("Connected to relay {}:{}", remote.address().to_string(), remote.port());
              set_status(ConnectionState::Connected);
              do_read();
            }
            finish(ec);
          });
      });
  });

  auto ec = result.get();
  if(ec) {
    error = "could not reach relay " + endpoint->host + ":" + std::to_string(endpoint->port) + ": " +
            (ec == asio::error::timed_out ? std::string("timed out") : ec.message());
    logger_->error("{}", error);
    set_status(ConnectionState::Error, error);
    return false;
  }
  return true;
}

void RelayClient::do_read() {
  asio::async_read_until(socket_, read_buf_, '\n',
    [this](std::error_code ec, std::size_t){
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        if(ec == asio::error::not_found) {
          fail("message from relay exceeds " + std::to_string(read_buf_.max_size()) + " bytes");
        } else if(ec == asio::error::eof) {
          fail("relay closed the connection");
        } else {
          fail(ec.message());
        }
        return;
      }
      std::istream is(&read_buf_);
      std::string line;
      std::getline(is, line);
      if(!line.empty() && line.back() == '\r') line.pop_back();
      if(!line.empty()) {
        auto j = json::parse(line, nullptr, false);
        std::string error;
        std::optional<RelayMessage> decoded;
        if(!j.is_discarded()) {
          try {
            decoded = decode_message(j, error);
          } catch(const json::exception& e) {
            error = e.what();
          }
        }
        if(j.is_discarded()) {
          logger_->debug("ignoring unparseable line from relay");
        } else if(!decoded) {
          logger_->debug("ignoring message from relay: {}", error);
        } else {
          if(options_.transfer_debug) {
            logger_->debug("recv {}", message_type(*decoded));
          }
          MessageHandler handler;
          {
            std::lock_guard lg(status_mutex_);
            handler = message_handler_;
          }
          if(handler) {
            try {
              handler(std::move(*decoded));
            } catch(const std::exception& e) {
              logger_->error("message handler threw on {}: {}", message_type(*decoded), e.what());
            }
          }
        }
      }
      do_read();
    });
}

bool RelayClient::emit(const RelayMessage& message, std::string& error) {
  auto line = encode_line(message);
  {
    std::unique_lock lk(queue_mutex_);
    queue_cv_.wait(lk, [&]{
      return !open_ || queued_bytes_ == 0 ||
             queued_bytes_ + line.size() <= options_.high_water_bytes;
    });
    if(!open_) {
      error = "not connected to relay";
      return false;
    }
    queued_bytes_ += line.size();
  }
  if(options_.transfer_debug) {
    logger_->debug("send {} ({} bytes)", message_type(message), line.size());
  }
  asio::post(io_, [this, line = std::move(line)]() mutable {
    if(!socket_.is_open()) {
      std::lock_guard lg(queue_mutex_);
      queued_bytes_ -= std::min(queued_bytes_, line.size());
      return;
    }
    bool idle = write_queue_.empty();
    write_queue_.push_back(std::move(line));
    if(idle) do_write();
  });
  return true;
}

void RelayClient::do_write() {
  if(write_queue_.empty()) return;
  asio::async_write(socket_, asio::buffer(write_queue_.front()),
    [this](std::error_code ec, std::size_t){
      std::size_t sent = write_queue_.front().size();
      write_queue_.pop_front();
      if(ec) write_queue_.clear();
      {
        std::lock_guard lg(queue_mutex_);
        queued_bytes_ = ec ? 0 : queued_bytes_ - std::min(queued_bytes_, sent);
      }
      queue_cv_.notify_all();
      if(ec) {
        if(ec != asio::error::operation_aborted) fail(ec.message());
        return;
      }
      if(!write_queue_.empty()) do_write();
    });
}

bool RelayClient::flush(std::chrono::milliseconds timeout) {
  std::unique_lock lk(queue_mutex_);
  queue_cv_.wait_for(lk, timeout, [&]{ return !open_ || queued_bytes_ == 0; });
  return open_ && queued_bytes_ == 0;
}

void RelayClient::fail(const std::string& reason) {
  std::error_code ignored;
  socket_.close(ignored);
  {
    std::lock_guard lg(queue_mutex_);
    open_ = false;
    queued_bytes_ = 0;
    if(stopping_) return;
  }
  queue_cv_.notify_all();
  logger_->warn("Relay connection lost: {}", reason);
  set_status(ConnectionState::Error, reason);
}

bool RelayClient::join(const std::string& room_id, std::string& error) {
  if(is_blank(room_id)) {
    error = "room id is blank";
    return false;
  }
  return emit(RoomJoin{room_id}, error);
}

bool RelayClient::leave(const std::string& room_id, std::string& error) {
  if(is_blank(room_id)) {
    error = "room id is blank";
    return false;
  }
  return emit(RoomLeave{room_id}, error);
}

void RelayClient::stop() {
  bool was_open = false;
  {
    std::lock_guard lg(queue_mutex_);
    stopping_ = true;
    was_open = open_;
    open_ = false;
  }
  queue_cv_.notify_all();
  if(!io_thread_.joinable()) return;

  asio::post(io_, [this](){
    std::error_code ignored;
    resolver_.cancel();
    connect_timer_.cancel();
    socket_.shutdown(tcp::socket::shutdown_send, ignored);
    socket_.close(ignored);
  });
  work_.reset();
  io_thread_.join();
  write_queue_.clear();
  if(was_open) {
    logger_->info("Disconnected from relay");
  }
  set_status(ConnectionState::Idle);
}
