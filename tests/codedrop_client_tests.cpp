#include "codedrop_client.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "transfer_error.hpp"
#include "utils.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

using codedrop::test::TempWorkspace;
using codedrop::test::TestCase;
using codedrop::test::TestContext;

struct Pair {
  std::shared_ptr<Logger> send_logger = std::make_shared<Logger>("sender");
  std::shared_ptr<Logger> receive_logger = std::make_shared<Logger>("receiver");
  TransferResult send_result;
  TransferResult receive_result;
};

asio::ip::tcp::endpoint sender_endpoint(uint16_t port) {
  return asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port);
}

// Sender on a worker thread, receiver on the calling thread.
void run_pair(TestContext& ctx, Pair& pair, const TransferConfig& send_config,
              const TransferConfig& receive_config, const fs::path& source, const std::string& passcode) {
  ctx.logs.attach(pair.send_logger);
  ctx.logs.attach(pair.receive_logger);
  std::thread sender([&]{
    CodedropClient client(send_config, pair.send_logger);
    pair.send_result = client.start_send(source);
  });
  CodedropClient receiver(receive_config, pair.receive_logger);
  pair.receive_result = receiver.start_receive(passcode);
  sender.join();
}

bool transferred(const Pair& pair, const std::string& content, const fs::path& destination) {
  if(!pair.send_result.ok() || !pair.receive_result.ok()) return false;
  if(codedrop::test::read_file(destination) != content) return false;
  return pair.send_result.outcome->sha256 == pair.receive_result.outcome->sha256 &&
         pair.receive_result.outcome->bytes_transferred == content.size();
}

bool test_direct_end_to_end(TestContext& ctx) {
  TempWorkspace workspace("client_direct");
  auto source = workspace.dir("src") / "report.pdf";
  auto content = codedrop::test::write_random_file(source, 150000, 482913);
  auto config = codedrop::test::loopback_config();
  config.passcode = "482913";
  config.output_dir = workspace.dir("out");

  Pair pair;
  run_pair(ctx, pair, config, config, source, "482913");
  return transferred(pair, content, config.output_dir / "report.pdf") &&
         ctx.logs.count_substring("presented the passcode") == 1;
}

bool test_broadcast_end_to_end(TestContext& ctx) {
  TempWorkspace workspace("client_broadcast");
  auto source = workspace.dir("src") / "photo.raw";
  auto content = codedrop::test::write_random_file(source, 2 * 1024 * 1024 + 3);
  auto config = codedrop::test::loopback_config();
  config.discovery_mode = DiscoveryMode::Broadcast;
  config.transfer_port = 0;  // announced, so any port works
  config.passcode_alphabet = PasscodeAlphabet::UpperAlphanumeric;
  config.passcode = "K7Q2ZD";
  config.output_dir = workspace.dir("out");

  Pair pair;
  run_pair(ctx, pair, config, config, source, "k7q2zd");
  if(!transferred(pair, content, config.output_dir / "photo.raw")) return false;
  const auto& token = pair.send_result.outcome->session_token;
  return token.size() == 32 && pair.receive_result.outcome->session_token == token;
}

bool test_wrong_passcodes_do_not_stop_sender(TestContext& ctx) {
  TempWorkspace workspace("client_wrong_codes");
  auto source = workspace.dir("src") / "data.bin";
  auto content = codedrop::test::write_random_file(source, 300000);
  auto config = codedrop::test::loopback_config();
  config.passcode = "482913";
  config.output_dir = workspace.dir("out");

  Pair pair;
  ctx.logs.attach(pair.send_logger);
  ctx.logs.attach(pair.receive_logger);
  std::thread sender([&]{
    CodedropClient client(config, pair.send_logger);
    pair.send_result = client.start_send(source);
  });
  if(!ctx.logs.wait_for_substring("Listening for the receiver", 3s)) {
    sender.join();
    return false;
  }

  asio::io_context io;
  std::vector<std::unique_ptr<TcpSession>> impostors;
  for(int i = 0; i < 4; ++i) {
    impostors.push_back(TcpSession::connect(io, sender_endpoint(config.transfer_port), 1000ms));
  }
  // Connected but silent; must not hold up pairing.
  auto silent = TcpSession::connect(io, sender_endpoint(config.transfer_port), 1000ms);
  const std::array<std::string, 4> guesses = {"000000", "482914", "999999", "123456"};
  for(std::size_t i = 0; i < impostors.size(); ++i) {
    impostors[i]->write_all(guesses[i].data(), guesses[i].size(), 1000ms);
  }
  std::size_t rejected = 0;
  for(auto& impostor : impostors) {
    if(!impostor->wait_readable(2000ms)) ++rejected;
  }

  CodedropClient receiver(config, pair.receive_logger);
  pair.receive_result = receiver.start_receive("482913");
  sender.join();

  bool silent_closed = !silent->wait_readable(2000ms);
  return rejected == 4 && silent_closed &&
         ctx.logs.count_substring("Rejected wrong passcode") == 4 &&
         transferred(pair, content, config.output_dir / "data.bin");
}

bool test_passcode_with_trailing_bytes_rejected(TestContext& ctx) {
  TempWorkspace workspace("client_long_code");
  auto source = workspace.dir("src") / "data.bin";
  auto content = codedrop::test::write_random_file(source, 20000);
  auto config = codedrop::test::loopback_config();
  config.passcode = "482913";
  config.output_dir = workspace.dir("out");

  Pair pair;
  ctx.logs.attach(pair.send_logger);
  ctx.logs.attach(pair.receive_logger);
  std::thread sender([&]{
    CodedropClient client(config, pair.send_logger);
    pair.send_result = client.start_send(source);
  });
  if(!ctx.logs.wait_for_substring("Listening for the receiver", 3s)) {
    sender.join();
    return false;
  }

  // Starts with the passcode but is one character longer.
  asio::io_context io;
  auto impostor = TcpSession::connect(io, sender_endpoint(config.transfer_port), 1000ms);
  const std::string longer = "4829130";
  impostor->write_all(longer.data(), longer.size(), 1000ms);
  bool refused = false;
  try {
    refused = !impostor->wait_readable(2000ms);
  } catch(const TransferFailure& failure) {
    // unread bytes turn the close into a reset
    refused = failure.kind() != TransferErrorKind::Timeout;
  }

  CodedropClient receiver(config, pair.receive_logger);
  pair.receive_result = receiver.start_receive("482913");
  sender.join();
  return refused &&
         ctx.logs.count_substring("Rejected wrong passcode") == 1 &&
         transferred(pair, content, config.output_dir / "data.bin");
}

bool test_receiver_with_wrong_passcode(TestContext& ctx) {
  TempWorkspace workspace("client_rejected");
  auto source = workspace.dir("src") / "data.bin";
  codedrop::test::write_random_file(source, 1000);
  auto config = codedrop::test::loopback_config();
  config.passcode = "482913";
  config.output_dir = workspace.dir("out");

  auto send_logger = std::make_shared<Logger>("sender");
  auto receive_logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(send_logger);
  ctx.logs.attach(receive_logger);
  CodedropClient sender_client(config, send_logger);
  TransferResult send_result;
  std::thread sender([&]{
    send_result = sender_client.start_send(source);
  });

  auto receive_config = config;
  receive_config.retry_budget = 3;
  CodedropClient receiver(receive_config, receive_logger);
  auto receive_result = receiver.start_receive("111111");

  sender_client.cancel();
  sender.join();
  return !receive_result.ok() &&
         receive_result.error->kind == TransferErrorKind::PasscodeRejected &&
         !send_result.ok() && send_result.error->kind == TransferErrorKind::Cancelled &&
         fs::is_empty(config.output_dir);
}

bool test_invalid_passcode_fails_before_network(TestContext& ctx) {
  auto config = codedrop::test::loopback_config();
  auto logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(logger);
  CodedropClient receiver(config, logger);
  auto started = std::chrono::steady_clock::now();
  auto result = receiver.start_receive("12ab");
  auto elapsed = std::chrono::steady_clock::now() - started;
  return !result.ok() && result.error->kind == TransferErrorKind::InvalidPasscode &&
         elapsed < 200ms &&
         ctx.logs.count_substring("Looking for a sender") == 0;
}

bool test_receiver_without_sender_direct(TestContext& ctx) {
  auto config = codedrop::test::loopback_config();
  config.retry_budget = 3;
  config.retry_interval = 50ms;
  auto logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(logger);
  CodedropClient receiver(config, logger);
  auto result = receiver.start_receive("482913");
  return !result.ok() && result.error->kind == TransferErrorKind::ConnectionFailed;
}

bool test_receiver_without_sender_broadcast(TestContext& ctx) {
  auto config = codedrop::test::loopback_config();
  config.discovery_mode = DiscoveryMode::Broadcast;
  config.retry_budget = 3;
  config.retry_interval = 50ms;
  auto logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(logger);
  CodedropClient receiver(config, logger);
  auto result = receiver.start_receive("482913");
  return !result.ok() && result.error->kind == TransferErrorKind::Timeout;
}

bool test_sender_without_receiver(TestContext& ctx) {
  TempWorkspace workspace("client_lonely");
  auto source = workspace.dir("src") / "data.bin";
  codedrop::test::write_random_file(source, 10);
  auto config = codedrop::test::loopback_config();
  config.retry_budget = 3;
  config.retry_interval = 50ms;
  auto logger = std::make_shared<Logger>("sender");
  ctx.logs.attach(logger);
  CodedropClient sender(config, logger);
  std::string shown;
  sender.set_passcode_callback([&](const std::string& passcode){ shown = passcode; });
  auto result = sender.start_send(source);
  return !result.ok() && result.error->kind == TransferErrorKind::Timeout &&
         shown.size() == config.passcode_length;
}

bool test_sender_port_taken(TestContext& ctx) {
  TempWorkspace workspace("client_port_taken");
  auto source = workspace.dir("src") / "data.bin";
  codedrop::test::write_random_file(source, 10);
  auto config = codedrop::test::loopback_config();
  config.retry_budget = 3;
  config.retry_interval = 100ms;

  asio::io_context io;
  asio::ip::tcp::acceptor holder(io, sender_endpoint(config.transfer_port));

  auto logger = std::make_shared<Logger>("sender");
  ctx.logs.attach(logger);
  CodedropClient sender(config, logger);
  auto started = std::chrono::steady_clock::now();
  auto result = sender.start_send(source);
  auto elapsed = std::chrono::steady_clock::now() - started;
  return !result.ok() && result.error->kind == TransferErrorKind::Timeout &&
         static_cast<bool>(result.error->cause) &&
         ctx.logs.count_substring("Cannot listen on") == 3 &&
         elapsed >= 250ms && elapsed < 2s;
}

bool test_missing_source_fails_before_network(TestContext& ctx) {
  TempWorkspace workspace("client_missing");
  auto config = codedrop::test::loopback_config();
  auto logger = std::make_shared<Logger>("sender");
  ctx.logs.attach(logger);
  CodedropClient sender(config, logger);
  auto result = sender.start_send(workspace.root() / "nope.bin");
  return !result.ok() && result.error->kind == TransferErrorKind::FileNotFound &&
         ctx.logs.count_substring("Listening for the receiver") == 0;
}

bool test_existing_destination(TestContext& ctx) {
  TempWorkspace workspace("client_exists");
  auto source = workspace.dir("src") / "notes.txt";
  codedrop::test::write_random_file(source, 5000);
  auto config = codedrop::test::loopback_config();
  config.passcode = "482913";
  config.output_dir = workspace.dir("out");
  {
    std::ofstream existing(config.output_dir / "notes.txt", std::ios::binary);
    existing << "original";
  }
  Pair pair;
  run_pair(ctx, pair, config, config, source, "482913");
  return !pair.receive_result.ok() &&
         pair.receive_result.error->kind == TransferErrorKind::FileExists &&
         codedrop::test::read_file(config.output_dir / "notes.txt") == "original";
}

bool test_cancel_while_searching(TestContext& ctx) {
  auto config = codedrop::test::loopback_config();
  config.discovery_mode = DiscoveryMode::Broadcast;
  config.retry_budget = 1000;
  auto logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(logger);
  CodedropClient receiver(config, logger);
  TransferResult result;
  auto started = std::chrono::steady_clock::now();
  std::thread worker([&]{
    result = receiver.start_receive("482913");
  });
  ctx.logs.wait_for_substring("Looking for a sender", 2s);
  std::this_thread::sleep_for(150ms);
  receiver.cancel();
  worker.join();
  auto elapsed = std::chrono::steady_clock::now() - started;
  return !result.ok() && result.error->kind == TransferErrorKind::Cancelled && elapsed < 3s;
}

bool test_session_restarts_after_reset(TestContext& ctx) {
  TempWorkspace workspace("client_restart");
  auto source = workspace.dir("src") / "big.bin";
  auto content = codedrop::test::write_random_file(source, 48 * 1024 * 1024);
  auto config = codedrop::test::loopback_config();
  config.passcode = "482913";
  config.session_retries = 1;
  config.output_dir = workspace.dir("out");

  Pair pair;
  ctx.logs.attach(pair.send_logger);
  ctx.logs.attach(pair.receive_logger);
  std::thread sender([&]{
    CodedropClient client(config, pair.send_logger);
    pair.send_result = client.start_send(source);
  });
  if(!ctx.logs.wait_for_substring("Listening for the receiver", 3s)) {
    sender.join();
    return false;
  }

  {
    // Takes the header and a little payload, then drops the connection.
    asio::io_context io;
    auto flaky = TcpSession::connect(io, sender_endpoint(config.transfer_port), 1000ms);
    flaky->write_all(config.passcode.data(), config.passcode.size(), 1000ms);
    std::array<char, 4096> scratch{};
    flaky->read_exact(scratch.data(), scratch.size(), 2000ms);
    flaky->close();
  }
  if(!ctx.logs.wait_for_substring("restarting from byte 0", 10s)) {
    sender.join();
    return false;
  }

  CodedropClient receiver(config, pair.receive_logger);
  pair.receive_result = receiver.start_receive("482913");
  sender.join();
  return transferred(pair, content, config.output_dir / "big.bin");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"direct_end_to_end", test_direct_end_to_end},
    {"broadcast_end_to_end", test_broadcast_end_to_end},
    {"wrong_passcodes_do_not_stop_sender", test_wrong_passcodes_do_not_stop_sender},
    {"passcode_with_trailing_bytes_rejected", test_passcode_with_trailing_bytes_rejected},
    {"receiver_with_wrong_passcode", test_receiver_with_wrong_passcode},
    {"invalid_passcode_fails_before_network", test_invalid_passcode_fails_before_network},
    {"receiver_without_sender_direct", test_receiver_without_sender_direct},
    {"receiver_without_sender_broadcast", test_receiver_without_sender_broadcast},
    {"sender_without_receiver", test_sender_without_receiver},
    {"sender_port_taken", test_sender_port_taken},
    {"missing_source_fails_before_network", test_missing_source_fails_before_network},
    {"existing_destination", test_existing_destination},
    {"cancel_while_searching", test_cancel_while_searching},
    {"session_restarts_after_reset", test_session_restarts_after_reset}
  };
  return codedrop::test::run_tests(argc, argv, "codedrop client", tests);
}
