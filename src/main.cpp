#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include "codedrop_client.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "progress_meter.hpp"
#include "settings_manager.hpp"
#include "transfer_config.hpp"
#include "utils.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

int run_transfer(CodedropClient& client, const SettingsManager& settings) {
  auto logger = client.logger();
  const auto mode = settings.get<std::string>("mode");
  const auto target = settings.get<std::string>("target");

  std::optional<ProgressMeter> meter;
  if(settings.get<bool>("transfer_progress")) {
    auto label = mode == "send" ? "Sending" : "Receiving";
    meter.emplace(std::cout, static_cast<std::size_t>(settings.get<int>("progress_meter_size")), label);
    client.set_progress_callback([&meter](const TransferProgress& progress){
      meter->update(progress);
    });
  }
  client.set_passcode_callback([&logger](const std::string& passcode){
    logger->print("Passcode: {}", passcode);
    logger->print("On the other machine run: codedrop receive {}", passcode);
  });

  // SIGINT/SIGTERM arrive on the io thread while a transfer pumps it.
  asio::signal_set signals(client.io(), SIGINT, SIGTERM);
  signals.async_wait([&client](const std::error_code& ec, int){
    if(!ec) client.cancel();
  });

  TransferResult result = mode == "send"
    ? client.start_send(target)
    : client.start_receive(target);

  std::error_code ignored;
  signals.cancel(ignored);
  if(meter) meter->finish();

  if(!result.ok()) {
    print_err("{}", result.error->describe());
    return kExitFailed;
  }
  const auto& outcome = *result.outcome;
  logger->print("{} {} ({}) {} {} in {:.1f}s",
                mode == "send" ? "Sent" : "Received",
                outcome.filename,
                format_bytes(outcome.bytes_transferred),
                mode == "send" ? "to" : "from",
                outcome.peer,
                static_cast<double>(outcome.elapsed.count()) / 1000.0);
  logger->print("sha256 {}", outcome.sha256);
  return kExitOk;
}

}

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "codedrop.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "codedrop");
    if(!parser.parse(argc, argv, settings)) {
      return kExitUsage;
    }
    if(settings.help_requested()) {
      parser.usage();
      return kExitOk;
    }

    init(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("codedrop");
    logger->debug("Verbose logging enabled");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      } else {
        logger->info("Settings saved to {}", settings.settings_path().string());
      }
    }

    const auto mode = settings.get<std::string>("mode");
    if(mode.empty()) {
      if(settings.save_requested()) return kExitOk;
      print_err("Missing mode: expected 'send' or 'receive'");
      parser.usage();
      return kExitUsage;
    }
    if(settings.get<std::string>("target").empty()) {
      print_err("{}", mode == "send" ? "Missing file to send" : "Missing passcode to receive");
      parser.usage();
      return kExitUsage;
    }

    TransferConfig config;
    try {
      config = TransferConfig::from_settings(settings);
    } catch(const TransferFailure& failure) {
      print_err("{}", failure.error().describe());
      return kExitUsage;
    }

    CodedropClient client(std::move(config), logger);
    return run_transfer(client, settings);
  } catch(std::exception& e) {
    init(false);
    Logger logger("codedrop-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return kExitFailed;
  }
}
