#include "relay_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "connection.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

RelayService::RelayService(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>(options_.log_name)),
    hub_(std::make_shared<RelayHub>(logger_)) {
  if(options_.max_message_bytes == 0) {
    options_.max_message_bytes = kMaxMessageBytes;
  }
}

RelayService::RelayService(std::shared_ptr<SettingsManager> settings)
  : RelayService(std::move(settings), Options{}) {}

RelayService::~RelayService() {
  stop();
}

void RelayService::start() {
  if(started_) return;

  listen_ip_ = settings_->get<std::string>("listen_ip");
  int listen_port_value = settings_->get<int>("listen_port");
  if(listen_port_value < 0 || listen_port_value > 65535) {
    logger_->error("Invalid listen_port '{}'", listen_port_value);
    throw std::runtime_error("Invalid listen_port");
  }
  listen_port_ = static_cast<uint16_t>(listen_port_value);

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(listen_ip_);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip_, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, listen_port_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();

  if(listen_port_ == 0) {
    listen_port_ = acceptor_->local_endpoint().port();
  }
  started_ = true;
  stopping_ = false;
  logger_->info("Relay listening on {}:{}", listen_ip_, listen_port_);

  start_accept();
}

void RelayService::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec == asio::error::operation_aborted || stopping_) return;
      if(ec) {
        logger_->error("Accept error: {}", ec.message());
      } else {
        auto conn = RelayConnection::create_incoming(std::move(socket), hub_, options_.max_message_bytes);
        logger_->debug("Accepted {} from {}", conn->peer_id(), conn->remote_address());
        connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                          [](const std::weak_ptr<RelayConnection>& w){ return w.expired(); }),
                           connections_.end());
        connections_.push_back(conn);
      }
      start_accept();
    });
}

void RelayService::run() {
  if(!started_) start();
  io_.run();
}

void RelayService::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void RelayService::request_stop() {
  if(stopping_.exchange(true)) return;
  asio::post(io_, [this](){
    close_all();
    io_.stop();
  });
}

void RelayService::close_all() {
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  auto open = std::move(connections_);
  connections_.clear();
  for(auto& weak : open) {
    if(auto conn = weak.lock()) conn->close();
  }
}

void RelayService::stop() {
  if(!started_) return;

  if(io_thread_.joinable()) {
    request_stop();
    io_thread_.join();
  } else {
    // run() already returned (or never ran); nothing else touches the sockets.
    stopping_ = true;
    close_all();
  }
  acceptor_.reset();
  started_ = false;

  auto s = hub_->stats();
  logger_->info("Relay stopped (forwarded {}, dropped {})", s.forwarded, s.dropped);
  io_.restart();
}
