#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <unordered_set>

#include "command_line_parser.hpp"
#include "file_source.hpp"
#include "folder_aggregator.hpp"
#include "log.hpp"
#include "reception_assembler.hpp"
#include "relay_client.hpp"
#include "relay_service.hpp"
#include "settings_manager.hpp"
#include "transfer_sender.hpp"
#include "utils.hpp"

namespace {

// Folder members arrive batch by batch; wait this long after a folder looks
// complete before saving it, in case more of its files are still coming.
constexpr std::chrono::milliseconds kFolderSettleDelay{1500};
constexpr std::chrono::seconds kFlushTimeout{120};

RelayClient::Options client_options(const SettingsManager& settings) {
  RelayClient::Options options;
  options.endpoint = settings.get<std::string>("relay");
  options.connect_timeout = std::chrono::milliseconds(settings.get<int>("connect_timeout_ms"));
  options.transfer_debug = settings.get<bool>("transfer_debug");
  return options;
}

std::string resolve_room(SettingsManager& settings, Logger& logger) {
  auto room = trim_copy(settings.get<std::string>("room_id"));
  if(room.empty()) {
    room = generate_room_id();
    logger.print("Generated room id: {}", room);
  }
  return room;
}

void print_status(Logger& logger, const ConnectionStatus& status) {
  if(status.state == ConnectionState::Error) {
    logger.print_err("relay: {} ({})", to_string(status.state), status.message);
  } else {
    logger.print("relay: {}", to_string(status.state));
  }
}

std::string human_size(uint64_t bytes) {
  const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while(value >= 1024.0 && unit + 1 < std::size(units)) {
    value /= 1024.0;
    ++unit;
  }
  return unit == 0 ? fmt::format("{} B", bytes) : fmt::format("{:.1f} {}", value, units[unit]);
}

// download_dir/name, or name-1, name-2... when taken.
std::filesystem::path unique_destination(const std::filesystem::path& dir, const std::string& name) {
  auto base = std::filesystem::path(name).filename();
  if(base.empty() || base == "." || base == "..") base = "unnamed";
  auto candidate = dir / base;
  std::error_code ec;
  for(int n = 1; std::filesystem::exists(candidate, ec); ++n) {
    candidate = dir / (base.stem().string() + "-" + std::to_string(n) + base.extension().string());
  }
  return candidate;
}

bool write_file(const std::filesystem::path& path, const std::vector<char>& bytes, std::string& error) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if(!out) {
    error = "failed to write " + path.string();
    return false;
  }
  return true;
}

int run_relay(const std::shared_ptr<SettingsManager>& settings) {
  RelayService service(settings);
  service.start();
  auto logger = service.logger();
  logger->print("roomshare relay on {}:{}", service.listen_ip(), service.listen_port());

  asio::signal_set signals(service.io(), SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& ec, int signal_number){
    if(ec) return;
    logger->info("Signal {} received, shutting down", signal_number);
    service.request_stop();
  });

  service.run();
  service.stop();
  return 0;
}

int run_send(const std::shared_ptr<SettingsManager>& settings) {
  auto logger = std::make_shared<Logger>("send");
  auto paths = settings->get<std::vector<std::string>>("paths");
  if(paths.empty()) {
    logger->print_err("Nothing to send: pass one or more files or folders");
    return 2;
  }

  auto collected = collect_files(paths);
  for(const auto& error : collected.errors) {
    logger->print_err("skipping {}", error);
  }
  if(collected.excluded > 0) {
    logger->print("Filtered {} file(s) (node_modules, .git, build output, logs)", collected.excluded);
  }
  if(collected.files.empty()) {
    logger->print_err("No files left to send");
    return 1;
  }

  auto room = resolve_room(*settings, *logger);
  auto client = std::make_shared<RelayClient>(client_options(*settings));
  client->set_status_listener([logger](const ConnectionStatus& status){ print_status(*logger, status); });

  std::string error;
  if(!client->connect(error)) return 1;
  if(!client->join(room, error)) {
    logger->print_err("Could not join room {}: {}", room, error);
    return 1;
  }

  TransferSender::Options sender_options;
  sender_options.transfer_debug = settings->get<bool>("transfer_debug");
  TransferSender sender(client, sender_options, logger);
  sender.subscribe([logger](const OutgoingTransfer& t){
    if(t.status == TransferStatus::Complete) {
      logger->print("  sent   {} ({})", t.meta.relative_path.value_or(t.meta.name), human_size(t.meta.size));
    } else if(t.status == TransferStatus::Error) {
      logger->print_err("  failed {}: {}", t.meta.relative_path.value_or(t.meta.name),
                        t.error_message.value_or("unknown error"));
    }
  });

  auto queued = sender.enqueue(std::move(collected.files));
  logger->print("Sending {} file(s) to room {}", queued, room);
  if(!sender.send_all(room, error)) {
    logger->print_err("Send refused: {}", error);
    client->stop();
    return 1;
  }
  if(!client->flush(kFlushTimeout)) {
    logger->print_err("Relay connection dropped before every message was written");
    sender.mark_undelivered("relay connection dropped before delivery");
  }
  client->stop();

  std::size_t failed = 0;
  for(const auto& t : sender.snapshot()) {
    if(t.status != TransferStatus::Complete) ++failed;
  }
  logger->print("{} of {} file(s) sent", queued - failed, queued);
  return failed == 0 ? 0 : 1;
}

class Receiver {
public:
  Receiver(std::shared_ptr<SettingsManager> settings, asio::io_context& io)
    : settings_(std::move(settings)),
      io_(io),
      logger_(std::make_shared<Logger>("receive")),
      assembler_(settings_->get<bool>("strict_assembly") ? AssemblyPolicy::Strict : AssemblyPolicy::Lenient,
                 logger_),
      folders_(logger_),
      download_dir_(settings_->get<std::string>("download_dir")),
      archive_mode_(settings_->get<std::string>("folder_save") == "archive") {
    assembler_.set_transfer_debug(settings_->get<bool>("transfer_debug"));
  }

  int run() {
    std::error_code ec;
    std::filesystem::create_directories(download_dir_, ec);
    if(ec) {
      logger_->print_err("Cannot create {}: {}", download_dir_.string(), ec.message());
      return 1;
    }
    auto room = resolve_room(*settings_, *logger_);

    client_ = std::make_unique<RelayClient>(client_options(*settings_));
    client_->set_status_listener([this](const ConnectionStatus& status){
      print_status(*logger_, status);
      if(status.state == ConnectionState::Error) {
        asio::post(io_, [this](){
          exit_code_ = 1;
          io_.stop();
        });
      }
    });
    client_->set_message_handler([this](RelayMessage message){ on_message(std::move(message)); });
    assembler_.subscribe([this](const IncomingTransfer& t){
      if(!is_terminal(t.status)) return;
      asio::post(io_, [this, t](){ on_finished(t); });
    });

    std::string error;
    if(!client_->connect(error)) return 1;
    if(!client_->join(room, error)) {
      logger_->print_err("Could not join room {}: {}", room, error);
      return 1;
    }

    asio::signal_set signals(io_, SIGINT, SIGTERM);
    signals.async_wait([this](const std::error_code& ec, int){
      if(ec) return;
      io_.stop();
    });
    auto guard = asio::make_work_guard(io_);
    io_.run();

    client_->stop();
    logger_->print("Stopped; {} file(s) written to {}", written_, download_dir_.string());
    return exit_code_;
  }

private:
  // Client io thread.
  void on_message(RelayMessage message) {
    if(auto* joined = std::get_if<RoomJoined>(&message)) {
      logger_->print("Joined room {}; waiting for files", joined->room_id);
    } else if(std::holds_alternative<PeerJoined>(message)) {
      logger_->print("A peer joined the room");
    } else if(std::holds_alternative<PeerLeft>(message)) {
      logger_->print("A peer left the room");
    } else if(auto* meta = std::get_if<FileMeta>(&message)) {
      // A new member restarts the folder's settle delay.
      if(meta->meta.relative_path) {
        auto folder = top_level_segment(*meta->meta.relative_path);
        if(!folder.empty()) {
          asio::post(io_, [this, folder](){ schedule_folder_check(folder); });
        }
      }
    }
    assembler_.handle(std::move(message));
  }

  void on_finished(const IncomingTransfer& t) {
    const auto label = t.meta.relative_path.value_or(t.meta.name);
    if(t.status == TransferStatus::Error) {
      logger_->print_err("  failed {}: {}", label, t.error_message.value_or("unknown error"));
      return;
    }
    if(!t.meta.relative_path) {
      save_plain(t);
      return;
    }
    schedule_folder_check(top_level_segment(*t.meta.relative_path));
  }

  void save_plain(const IncomingTransfer& t) {
    auto payload = assembler_.take_payload(t.meta.transfer_id);
    if(!payload) return;
    consumed_.insert(t.meta.transfer_id);
    auto destination = unique_destination(download_dir_, t.meta.name);
    std::string error;
    if(!write_file(destination, *payload, error)) {
      logger_->print_err("  {}", error);
      return;
    }
    ++written_;
    logger_->print("  saved  {} ({})", destination.string(), human_size(payload->size()));
  }

  void schedule_folder_check(const std::string& folder) {
    auto& timer = folder_timers_[folder];
    if(!timer) timer = std::make_unique<asio::steady_timer>(io_);
    timer->expires_after(kFolderSettleDelay);
    timer->async_wait([this, folder](const std::error_code& ec){
      if(ec) return;
      check_folder(folder);
    });
  }

  void check_folder(const std::string& folder) {
    std::vector<IncomingTransfer> live;
    for(auto& t : assembler_.snapshot()) {
      if(consumed_.count(t.meta.transfer_id) == 0) live.push_back(std::move(t));
    }
    if(FolderAggregator::transfers_in_flight(live)) {
      schedule_folder_check(folder);
      return;
    }
    for(const auto& group : folders_.groups(live)) {
      if(group.name != folder) continue;
      if(!FolderAggregator::is_ready(group)) {
        bool failed = std::any_of(group.members.begin(), group.members.end(),
          [](const IncomingTransfer& m){ return m.status == TransferStatus::Error; });
        if(failed) logger_->print_err("  folder {} has failed files and cannot be saved", folder);
        return;
      }
      auto result = folders_.save(group, make_target());
      if(result.outcome == SaveOutcome::Saved || result.outcome == SaveOutcome::Archived) {
        for(const auto& member : group.members) {
          consumed_.insert(member.meta.transfer_id);
          assembler_.take_payload(member.meta.transfer_id);
        }
        written_ += result.files;
        logger_->print("  {} folder {} ({} file(s)) -> {}", to_string(result.outcome), folder,
                       result.files, result.location.string());
      } else {
        logger_->print_err("  folder {}: {}", folder, result.message);
      }
      return;
    }
  }

  SaveTarget make_target() {
    SaveTarget target;
    if(archive_mode_) {
      target.archive_sink = [this](const std::string& file_name,
                                   const std::vector<char>& archive,
                                   std::filesystem::path& written,
                                   std::string& error){
        written = unique_destination(download_dir_, file_name);
        return write_file(written, archive, error);
      };
    } else {
      target.choose_directory = [this](const std::string&) -> std::optional<std::filesystem::path> {
        return download_dir_;
      };
    }
    return target;
  }

  std::shared_ptr<SettingsManager> settings_;
  asio::io_context& io_;
  std::shared_ptr<Logger> logger_;
  ReceptionAssembler assembler_;
  FolderAggregator folders_;
  std::filesystem::path download_dir_;
  bool archive_mode_ = false;
  std::unique_ptr<RelayClient> client_;
  std::map<std::string, std::unique_ptr<asio::steady_timer>> folder_timers_;
  std::unordered_set<std::string> consumed_;
  std::size_t written_ = 0;
  int exit_code_ = 0;
};

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->load();

    CommandLineParser parser("roomshare");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      init(false);
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      init(false);
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"));
    if(settings->save_requested()) {
      if(!settings->save()) {
        log_error(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto mode = settings->get<std::string>("mode");
    if(mode == "send") {
      return run_send(settings);
    }
    if(mode == "receive") {
      asio::io_context io;
      Receiver receiver(settings, io);
      return receiver.run();
    }
    return run_relay(settings);
  } catch(std::exception& e) {
    init(false);
    Logger logger("roomshare");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
