#include "file_source.hpp"
#include "folder_aggregator.hpp"
#include "protocol.hpp"
#include "reception_assembler.hpp"
#include "relay_client.hpp"
#include "relay_hub.hpp"
#include "relay_service.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_sender.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

using roomshare::test::TestCase;
using roomshare::test::TestContext;
using roomshare::test::expect;
using roomshare::test::wait_for_condition;
using namespace std::chrono_literals;

namespace {

class FakePeer : public RelayPeer {
public:
  explicit FakePeer(std::string id) : id_(std::move(id)) {}

  std::string peer_id() const override { return id_; }
  void send_line(const std::string& line) override { lines.push_back(line); }

  // "type:roomId" for each received line.
  std::vector<std::string> notices() const {
    std::vector<std::string> out;
    for(const auto& line : lines) {
      auto env = parse_envelope(line);
      out.push_back(env ? env->type + ":" + env->room_id.value_or("?") : "<garbage>");
    }
    return out;
  }

  std::vector<std::string> lines;

private:
  std::string id_;
};

std::string join_line(const std::string& room) {
  return encode_message(RoomJoin{room}).dump();
}

struct HubFixture {
  std::shared_ptr<RelayHub> hub = std::make_shared<RelayHub>();
  std::map<std::string, std::shared_ptr<FakePeer>> peers;

  FakePeer& add(const std::string& id) {
    auto peer = std::make_shared<FakePeer>(id);
    hub->attach(peer);
    peers[id] = peer;
    return *peer;
  }

  void clear() {
    for(auto& [id, peer] : peers) peer->lines.clear();
  }
};

std::shared_ptr<SettingsManager> loopback_settings() {
  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  settings->set_from_string("listen_ip", "127.0.0.1", error);
  settings->set_from_string("listen_port", "0", error);
  return settings;
}

RelayClient::Options client_options(uint16_t port) {
  RelayClient::Options options;
  options.endpoint = "127.0.0.1:" + std::to_string(port);
  options.connect_timeout = 3000ms;
  return options;
}

// Minimal line-oriented socket for poking the relay without the client.
class RawLine {
public:
  explicit RawLine(uint16_t port) : socket_(io_) {
    socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  }

  void write(const std::string& line) {
    asio::write(socket_, asio::buffer(line + "\n"));
  }

  std::optional<std::string> read(std::chrono::milliseconds timeout) {
    std::optional<std::string> out;
    asio::async_read_until(socket_, buf_, '\n', [&](std::error_code ec, std::size_t n){
      if(ec) return;
      std::string line(asio::buffers_begin(buf_.data()), asio::buffers_begin(buf_.data()) + n);
      buf_.consume(n);
      line.pop_back();
      out = std::move(line);
    });
    io_.restart();
    io_.run_for(timeout);
    if(!out) {
      std::error_code ignored;
      socket_.cancel(ignored);
      io_.restart();
      io_.run();
    }
    return out;
  }

private:
  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  asio::streambuf buf_;
};

// ---- hub ------------------------------------------------------------------

bool test_join_notifies_room(TestContext&) {
  HubFixture f;
  auto& a = f.add("a");
  auto& b = f.add("b");
  auto& c = f.add("c");

  f.hub->handle_line("a", join_line("ab12"));
  if(!expect((a.notices() == std::vector<std::string>{"room:joined:ab12"}), "(a.notices() == std::vector<std::string>{\"room:joined:ab12\"})")) return false;
  if(!expect(b.lines.empty() && c.lines.empty(), "b.lines.empty() && c.lines.empty()")) return false;

  f.clear();
  f.hub->handle_line("b", join_line("ab12"));
  if(!expect((b.notices() == std::vector<std::string>{"room:joined:ab12"}), "(b.notices() == std::vector<std::string>{\"room:joined:ab12\"})")) return false;
  if(!expect((a.notices() == std::vector<std::string>{"peer:joined:ab12"}), "(a.notices() == std::vector<std::string>{\"peer:joined:ab12\"})")) return false;
  if(!expect(c.lines.empty(), "c.lines.empty()")) return false;

  f.clear();
  f.hub->handle_line("c", join_line("ab12"));
  if(!expect((a.notices() == std::vector<std::string>{"peer:joined:ab12"}), "(a.notices() == std::vector<std::string>{\"peer:joined:ab12\"})")) return false;
  if(!expect((b.notices() == std::vector<std::string>{"peer:joined:ab12"}), "(b.notices() == std::vector<std::string>{\"peer:joined:ab12\"})")) return false;
  if(!expect(f.hub->members("ab12").size() == 3, "f.hub->members(\"ab12\").size() == 3")) return false;

  // Joining again only re-acknowledges the joiner.
  f.clear();
  f.hub->handle_line("b", join_line("ab12"));
  if(!expect((b.notices() == std::vector<std::string>{"room:joined:ab12"}), "(b.notices() == std::vector<std::string>{\"room:joined:ab12\"})")) return false;
  if(!expect(a.lines.empty() && c.lines.empty(), "a.lines.empty() && c.lines.empty()")) return false;
  if(!expect(f.hub->members("ab12").size() == 3, "f.hub->members(\"ab12\").size() == 3")) return false;

  if(!expect(!f.hub->join("nobody", "ab12"), "!f.hub->join(\"nobody\", \"ab12\")")) return false;
  if(!expect(f.hub->stats().rooms == 1, "f.hub->stats().rooms == 1")) return false;
  return true;
}

bool test_broadcast_excludes_sender(TestContext&) {
  HubFixture f;
  auto& a = f.add("a");
  auto& b = f.add("b");
  auto& c = f.add("c");
  auto& outsider = f.add("d");
  f.hub->join("a", "r");
  f.hub->join("b", "r");
  f.hub->join("c", "other");
  f.clear();

  // Odd spacing, key order and an unknown field all survive the relay.
  const std::string line =
    R"({"roomId":"r",  "type":"file:complete","transferId":"t-1", "extra":[1,2,{"k":null}]})";
  f.hub->handle_line("a", line);
  if(!expect(a.lines.empty(), "a.lines.empty()")) return false;
  if(!expect(b.lines.size() == 1 && b.lines[0] == line, "b.lines.size() == 1 && b.lines[0] == line")) return false;
  if(!expect(c.lines.empty() && outsider.lines.empty(), "c.lines.empty() && outsider.lines.empty()")) return false;

  // A non-member can still post into the room.
  f.clear();
  auto chunk = encode_message(FileChunk{"r", "t-1", 0, {'x', 'y'}}).dump();
  f.hub->handle_line("d", chunk);
  if(!expect(a.lines.size() == 1 && a.lines[0] == chunk, "a.lines.size() == 1 && a.lines[0] == chunk")) return false;
  if(!expect(b.lines.size() == 1 && b.lines[0] == chunk, "b.lines.size() == 1 && b.lines[0] == chunk")) return false;
  if(!expect(outsider.lines.empty(), "outsider.lines.empty()")) return false;

  // Nobody else in the room: still counted, nobody receives it.
  f.clear();
  if(!expect(f.hub->broadcast("c", "other", line) == 0, "f.hub->broadcast(\"c\", \"other\", line) == 0")) return false;
  if(!expect(f.hub->stats().forwarded == 3, "f.hub->stats().forwarded == 3")) return false;
  if(!expect(f.hub->stats().dropped == 0, "f.hub->stats().dropped == 0")) return false;
  return true;
}

bool test_disconnect_notifies_each_room(TestContext&) {
  HubFixture f;
  f.add("a");
  auto& b = f.add("b");
  auto& c = f.add("c");
  f.hub->join("a", "x");
  f.hub->join("a", "y");
  f.hub->join("b", "x");
  f.hub->join("c", "y");
  f.clear();

  f.hub->detach("a");
  if(!expect((b.notices() == std::vector<std::string>{"peer:left:x"}), "(b.notices() == std::vector<std::string>{\"peer:left:x\"})")) return false;
  if(!expect((c.notices() == std::vector<std::string>{"peer:left:y"}), "(c.notices() == std::vector<std::string>{\"peer:left:y\"})")) return false;
  if(!expect(f.hub->rooms_of("a").empty(), "f.hub->rooms_of(\"a\").empty()")) return false;
  if(!expect(f.hub->members("x").size() == 1, "f.hub->members(\"x\").size() == 1")) return false;
  if(!expect(f.hub->stats().connections == 2, "f.hub->stats().connections == 2")) return false;

  // A second detach is a no-op.
  f.clear();
  f.hub->detach("a");
  if(!expect(b.lines.empty() && c.lines.empty(), "b.lines.empty() && c.lines.empty()")) return false;

  f.add("e");
  f.hub->join("e", "x");
  f.clear();
  f.hub->handle_line("e", encode_message(RoomLeave{"x"}).dump());
  if(!expect((b.notices() == std::vector<std::string>{"peer:left:x"}), "(b.notices() == std::vector<std::string>{\"peer:left:x\"})")) return false;
  if(!expect(!f.hub->leave("e", "x"), "!f.hub->leave(\"e\", \"x\")")) return false;
  if(!expect((f.hub->rooms_of("b") == std::vector<std::string>{"x"}), "(f.hub->rooms_of(\"b\") == std::vector<std::string>{\"x\"})")) return false;

  f.hub->leave("b", "x");
  if(!expect(f.hub->members("x").empty(), "f.hub->members(\"x\").empty()")) return false;
  if(!expect(f.hub->stats().rooms == 1, "f.hub->stats().rooms == 1")) return false;
  return true;
}

bool test_unroutable_lines_dropped(TestContext&) {
  HubFixture f;
  auto& a = f.add("a");
  auto& b = f.add("b");
  f.hub->join("a", "r");
  f.hub->join("b", "r");
  f.clear();

  const std::vector<std::string> bad = {
    "not json at all",
    "[\"file:chunk\",\"r\"]",
    R"({"type":"file:chunk","transferId":"t"})",
    R"({"type":"file:chunk","roomId":"   "})",
    R"({"type":"file:meta","roomId":42})",
    R"({"type":"chat:message","roomId":"r"})",
    R"({"type":"peer:joined","roomId":"r"})",
    R"({"type":"room:join","roomId":""})",
  };
  for(const auto& line : bad) f.hub->handle_line("a", line);

  if(!expect(a.lines.empty() && b.lines.empty(), "a.lines.empty() && b.lines.empty()")) return false;
  auto stats = f.hub->stats();
  if(!expect(stats.dropped == bad.size(), "stats.dropped == bad.size()")) return false;
  if(!expect(stats.forwarded == 0, "stats.forwarded == 0")) return false;
  if(!expect(f.hub->members("r").size() == 2, "f.hub->members(\"r\").size() == 2")) return false;
  return true;
}

// ---- over TCP -------------------------------------------------------------

bool test_loopback_transfer(TestContext& ctx) {
  RelayService service(loopback_settings());
  ctx.logs.attach(service.logger(), "relay");
  service.start_background();
  if(!expect(service.listen_port() != 0, "service.listen_port() != 0")) return false;

  ReceptionAssembler assembler;
  std::atomic<bool> receiver_joined{false}, peer_arrived{false}, peer_gone{false};
  RelayClient receiver(client_options(service.listen_port()));
  ctx.logs.attach(receiver.logger(), "receiver");
  receiver.set_message_handler([&](RelayMessage message){
    if(std::holds_alternative<RoomJoined>(message)) receiver_joined = true;
    if(std::holds_alternative<PeerJoined>(message)) peer_arrived = true;
    if(std::holds_alternative<PeerLeft>(message)) peer_gone = true;
    assembler.handle(std::move(message));
  });

  std::string error;
  if(!expect(receiver.connect(error), "receiver.connect(error)")) return false;
  if(!expect(receiver.status().state == ConnectionState::Connected, "receiver.status().state == ConnectionState::Connected")) return false;
  if(!expect(receiver.join("ab12", error), "receiver.join(\"ab12\", error)")) return false;
  if(!expect(wait_for_condition([&]{ return receiver_joined.load(); }, 3s), "wait_for_condition([&]{ return receiver_joined.load(); }, 3s)")) return false;

  std::atomic<bool> sender_joined{false};
  auto sender_client = std::make_shared<RelayClient>(client_options(service.listen_port()));
  sender_client->set_message_handler([&](RelayMessage message){
    if(std::holds_alternative<RoomJoined>(message)) sender_joined = true;
  });
  if(!expect(sender_client->connect(error), "sender_client->connect(error)")) return false;
  if(!expect(sender_client->join("ab12", error), "sender_client->join(\"ab12\", error)")) return false;
  if(!expect(wait_for_condition([&]{ return sender_joined.load() && peer_arrived.load(); }, 3s), "wait_for_condition([&]{ return sender_joined.load() && peer_arrived.load(); }, 3s)")) return false;
  if(!expect(service.hub()->members("ab12").size() == 2, "service.hub()->members(\"ab12\").size() == 2")) return false;

  TransferSender::Options options;
  options.chunk_size = 4096;
  TransferSender sender(sender_client, options);
  auto photo = roomshare::test::pattern_bytes(4096 * 5 + 123, 11);
  auto notes = roomshare::test::pattern_bytes(700, 12);
  sender.enqueue({
    std::make_shared<MemoryFileSource>("photo.bin", photo, std::string("album/photo.bin")),
    std::make_shared<MemoryFileSource>("notes.txt", notes, std::string("album/notes.txt")),
    std::make_shared<MemoryFileSource>("empty.dat", std::vector<char>{}),
  });
  if(!expect(sender.send_all("ab12", error), "sender.send_all(\"ab12\", error)")) return false;
  if(!expect(sender_client->flush(5s), "sender_client->flush(5s)")) return false;

  if(!expect(wait_for_condition([&]{
    auto snap = assembler.snapshot();
    return snap.size() == 3 && std::all_of(snap.begin(), snap.end(),
      [](const IncomingTransfer& t){ return t.status == TransferStatus::Complete; });
  }, 5s), "wait_for_condition([&]{ auto snap = assembler.snapshot(); return snap.size() == 3 && std::all_of(snap.begin(), snap.end(), [](const IncomingTransfer& t){ return t.status == TransferStatus::Complete; }); }, 5s)")) return false;

  std::map<std::string, IncomingTransfer> by_name;
  for(const auto& t : assembler.snapshot()) by_name[t.meta.name] = t;
  if(!expect(*by_name["photo.bin"].payload == photo, "*by_name[\"photo.bin\"].payload == photo")) return false;
  if(!expect(by_name["photo.bin"].meta.total_chunks == 6, "by_name[\"photo.bin\"].meta.total_chunks == 6")) return false;
  if(!expect(*by_name["notes.txt"].payload == notes, "*by_name[\"notes.txt\"].payload == notes")) return false;
  if(!expect(by_name["notes.txt"].meta.mime_type == "text/plain", "by_name[\"notes.txt\"].meta.mime_type == \"text/plain\"")) return false;
  if(!expect(by_name["empty.dat"].payload->empty(), "by_name[\"empty.dat\"].payload->empty()")) return false;
  if(!expect(!by_name["empty.dat"].meta.relative_path, "!by_name[\"empty.dat\"].meta.relative_path")) return false;

  FolderAggregator folders;
  auto groups = folders.groups(assembler.snapshot());
  if(!expect(groups.size() == 1 && groups[0].name == "album", "groups.size() == 1 && groups[0].name == \"album\"")) return false;
  if(!expect(FolderAggregator::is_ready(groups[0]), "FolderAggregator::is_ready(groups[0])")) return false;

  // 3 metas, 6 + 1 + 1 chunks, 3 completes.
  if(!expect(wait_for_condition([&]{ return service.stats().forwarded == 14; }, 3s), "wait_for_condition([&]{ return service.stats().forwarded == 14; }, 3s)")) return false;

  sender_client->stop();
  if(!expect(wait_for_condition([&]{ return peer_gone.load(); }, 3s), "wait_for_condition([&]{ return peer_gone.load(); }, 3s)")) return false;
  if(!expect(sender_client->status().state == ConnectionState::Idle, "sender_client->status().state == ConnectionState::Idle")) return false;
  if(!expect(!sender_client->connected(), "!sender_client->connected()")) return false;
  if(!expect(wait_for_condition([&]{ return service.stats().connections == 1; }, 3s), "wait_for_condition([&]{ return service.stats().connections == 1; }, 3s)")) return false;

  receiver.stop();
  service.stop();
  return true;
}

bool test_lines_cross_relay_verbatim(TestContext&) {
  RelayService service(loopback_settings());
  service.start_background();

  RawLine a(service.listen_port());
  RawLine b(service.listen_port());
  a.write(join_line("raw"));
  if(!expect(a.read(3s) == std::optional<std::string>(R"({"roomId":"raw","type":"room:joined"})"), "a.read(3s) == std::optional<std::string>(R\"({\"roomId\":\"raw\",\"type\":\"room:joined\"})\")")) return false;
  b.write(join_line("raw"));
  if(!expect(b.read(3s) == std::optional<std::string>(R"({"roomId":"raw","type":"room:joined"})"), "b.read(3s) == std::optional<std::string>(R\"({\"roomId\":\"raw\",\"type\":\"room:joined\"})\")")) return false;
  if(!expect(a.read(3s) == std::optional<std::string>(R"({"roomId":"raw","type":"peer:joined"})"), "a.read(3s) == std::optional<std::string>(R\"({\"roomId\":\"raw\",\"type\":\"peer:joined\"})\")")) return false;

  const std::string odd = R"({ "type" : "file:error", "roomId":"raw", "transferId":"t9", "message":"boom" })";
  a.write("garbage");
  a.write(R"({"type":"file:error","roomId":"elsewhere","transferId":"t8"})");
  a.write(odd + "\r");
  if(!expect(b.read(3s) == std::optional<std::string>(odd), "b.read(3s) == std::optional<std::string>(odd)")) return false;
  if(!expect(!a.read(200ms), "!a.read(200ms)")) return false;

  if(!expect(wait_for_condition([&]{
    auto stats = service.stats();
    return stats.dropped == 1 && stats.forwarded == 2;
  }, 3s), "wait_for_condition([&]{ auto stats = service.stats(); return stats.dropped == 1 && stats.forwarded == 2; }, 3s)")) return false;
  service.stop();
  return true;
}

bool test_client_connect_failure(TestContext&) {
  // Grab a free port and release it so nothing is listening there.
  uint16_t port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor reserve(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = reserve.local_endpoint().port();
  }

  auto options = client_options(port);
  options.connect_timeout = 2000ms;
  auto client = std::make_shared<RelayClient>(options);
  std::mutex m;
  std::vector<ConnectionState> states;
  client->set_status_listener([&](const ConnectionStatus& s){
    std::lock_guard lg(m);
    states.push_back(s.state);
  });

  std::string error;
  if(!expect(!client->connect(error), "!client->connect(error)")) return false;
  if(!expect(!error.empty(), "!error.empty()")) return false;
  if(!expect(client->status().state == ConnectionState::Error, "client->status().state == ConnectionState::Error")) return false;
  if(!expect(!client->status().message.empty(), "!client->status().message.empty()")) return false;
  {
    std::lock_guard lg(m);
    if(!expect(!states.empty() && states.front() == ConnectionState::Connecting, "!states.empty() && states.front() == ConnectionState::Connecting")) return false;
    if(!expect(states.back() == ConnectionState::Error, "states.back() == ConnectionState::Error")) return false;
  }

  if(!expect(!client->emit(RoomJoin{"r"}, error), "!client->emit(RoomJoin{\"r\"}, error)")) return false;
  if(!expect(!client->join("   ", error), "!client->join(\" \", error)")) return false;

  TransferSender sender(client);
  sender.enqueue({std::make_shared<MemoryFileSource>("a.txt", std::vector<char>{'a'})});
  if(!expect(!sender.send_all("r", error), "!sender.send_all(\"r\", error)")) return false;
  if(!expect(sender.queued() == 1, "sender.queued() == 1")) return false;

  RelayClient::Options bad;
  bad.endpoint = "relay.lan:99999";
  RelayClient misconfigured(bad);
  if(!expect(!misconfigured.connect(error), "!misconfigured.connect(error)")) return false;
  if(!expect(misconfigured.status().state == ConnectionState::Error, "misconfigured.status().state == ConnectionState::Error")) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"join_notifies_room", test_join_notifies_room},
    {"broadcast_excludes_sender", test_broadcast_excludes_sender},
    {"disconnect_notifies_each_room", test_disconnect_notifies_each_room},
    {"unroutable_lines_dropped", test_unroutable_lines_dropped},
    {"loopback_transfer", test_loopback_transfer},
    {"lines_cross_relay_verbatim", test_lines_cross_relay_verbatim},
    {"client_connect_failure", test_client_connect_failure},
  };
  return roomshare::test::run_tests("relay", std::move(tests), argc, argv);
}
