#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_config.hpp"
#include "transfer_error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

using codedrop::test::TempWorkspace;
using codedrop::test::TestCase;
using codedrop::test::TestContext;

bool parse_args(std::vector<std::string> args, SettingsManager& settings) {
  args.insert(args.begin(), "codedrop");
  std::vector<char*> argv;
  for(auto& arg : args) argv.push_back(&arg[0]);
  CommandLineParser parser;
  return parser.parse(static_cast<int>(argv.size()), argv.data(), settings);
}

bool test_defaults(TestContext&) {
  SettingsManager settings;
  auto config = TransferConfig::from_settings(settings);
  return config.chunk_size == 65536 &&
         config.discovery_mode == DiscoveryMode::Broadcast &&
         config.retry_budget == 30 &&
         config.retry_interval == std::chrono::milliseconds(1000) &&
         config.handshake_timeout == std::chrono::milliseconds(5000) &&
         config.transfer_port == 9527 &&
         config.discovery_port == 9528 &&
         config.passcode_alphabet == PasscodeAlphabet::Digits &&
         config.passcode_length == 6 &&
         !config.atomic_write;
}

bool test_typed_setters(TestContext&) {
  SettingsManager settings;
  std::string error;
  if(!settings.set_from_string("cs", "1024", error)) return false;
  if(settings.get<int>("chunk_size") != 1024) return false;
  if(settings.set_from_string("chunk_size", "0", error)) return false;
  if(settings.set_from_string("chunk_size", "16777217", error)) return false;
  if(settings.set_from_string("chunk_size", "12kb", error)) return false;
  if(settings.get<int>("chunk_size") != 1024) return false;

  if(!settings.set_from_string("discovery", "direct", error)) return false;
  if(settings.set_from_string("discovery_mode", "carrier-pigeon", error)) return false;
  if(error.find("broadcast") == std::string::npos) return false;

  if(!settings.set_from_string("atomic", "on", error) || !settings.get<bool>("atomic_write")) return false;
  if(settings.set_from_json("passcode_length", "six", error)) return false;
  return !settings.set_from_string("no_such_setting", "1", error) && error == "unknown setting";
}

bool test_save_and_load(TestContext&) {
  TempWorkspace workspace("settings_save");
  auto path = workspace.root() / ".config" / "codedrop.json";
  {
    SettingsManager settings;
    settings.set_settings_path(path);
    std::string error;
    settings.set_from_string("retry_budget", "12", error);
    settings.set_from_string("passcode", "482913", error);
    if(!settings.save()) return false;
  }
  std::ifstream in(path);
  auto doc = nlohmann::json::parse(in);
  // one-shot values are never written
  if(doc.contains("passcode") || doc.contains("mode") || doc.value("retry_budget", 0) != 12) return false;

  SettingsManager reloaded;
  reloaded.set_settings_path(path);
  return reloaded.load() && reloaded.get<int>("retry_budget") == 12 &&
         reloaded.get<std::string>("passcode").empty();
}

bool test_load_skips_invalid_values(TestContext&) {
  TempWorkspace workspace("settings_invalid");
  auto path = workspace.root() / "codedrop.json";
  {
    std::ofstream out(path);
    out << R"({"chunk_size": -5, "discovery_mode": "direct", "unknown": true})";
  }
  SettingsManager settings;
  settings.set_settings_path(path);
  return settings.load() &&
         settings.get<int>("chunk_size") == 65536 &&
         settings.get<std::string>("discovery_mode") == "direct";
}

bool test_config_validation(TestContext&) {
  auto expect_invalid = [](const TransferConfig& config){
    try {
      config.validate();
      return false;
    } catch(const TransferFailure& failure) {
      return failure.kind() == TransferErrorKind::InvalidConfig;
    }
  };
  TransferConfig config;
  config.validate();

  auto zero_chunk = config;
  zero_chunk.chunk_size = 0;
  auto huge_chunk = config;
  huge_chunk.chunk_size = TransferConfig::kMaxChunkSize + 1;
  auto no_timeout = config;
  no_timeout.io_timeout = std::chrono::milliseconds(0);
  auto short_code = config;
  short_code.passcode_length = 3;
  auto bad_bind = config;
  bad_bind.bind_address = "not-an-address";
  auto bad_broadcast = config;
  bad_broadcast.broadcast_address = "everyone";
  return expect_invalid(zero_chunk) && expect_invalid(huge_chunk) && expect_invalid(no_timeout) &&
         expect_invalid(short_code) && expect_invalid(bad_bind) && expect_invalid(bad_broadcast);
}

bool test_command_line(TestContext&) {
  SettingsManager settings;
  if(!parse_args({"send", "report.pdf", "--chunk_size", "4096", "-dm", "direct", "--atomic_write", "-v"}, settings)) {
    return false;
  }
  if(settings.get<std::string>("mode") != "send" ||
     settings.get<std::string>("target") != "report.pdf" ||
     settings.get<int>("chunk_size") != 4096 ||
     settings.get<std::string>("discovery_mode") != "direct" ||
     !settings.get<bool>("atomic_write") ||
     !settings.get<bool>("verbose")) {
    return false;
  }
  auto config = TransferConfig::from_settings(settings);
  return config.chunk_size == 4096 && config.discovery_mode == DiscoveryMode::Direct;
}

bool test_command_line_errors(TestContext&) {
  SettingsManager settings;
  if(parse_args({"fetch", "x"}, settings)) return false;
  if(parse_args({"send", "a", "b"}, settings)) return false;
  if(parse_args({"--bogus", "1"}, settings)) return false;
  if(parse_args({"receive", "482913", "--chunk_size"}, settings)) return false;
  return !parse_args({"receive", "482913", "--chunk_size", "zero"}, settings);
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"typed_setters", test_typed_setters},
    {"save_and_load", test_save_and_load},
    {"load_skips_invalid_values", test_load_skips_invalid_values},
    {"config_validation", test_config_validation},
    {"command_line", test_command_line},
    {"command_line_errors", test_command_line_errors}
  };
  return codedrop::test::run_tests(argc, argv, "settings", tests);
}
