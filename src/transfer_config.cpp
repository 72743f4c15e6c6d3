#include "transfer_config.hpp"

#include <asio/ip/address.hpp>

#include "settings_manager.hpp"
#include "transfer_error.hpp"

namespace {

void require(bool condition, const std::string& message) {
  if(!condition) {
    throw TransferFailure(make_error(TransferErrorKind::InvalidConfig, message));
  }
}

bool is_ip_address(const std::string& text) {
  std::error_code ec;
  asio::ip::make_address(text, ec);
  return !ec;
}

} // namespace

const char* to_string(DiscoveryMode mode) {
  return mode == DiscoveryMode::Direct ? "direct" : "broadcast";
}

void TransferConfig::validate() const {
  require(chunk_size > 0 && chunk_size <= kMaxChunkSize,
          "chunk_size must be between 1 and " + std::to_string(kMaxChunkSize));
  require(retry_budget > 0, "retry_budget must be positive");
  require(retry_interval.count() > 0, "retry_interval must be positive");
  require(handshake_timeout.count() > 0, "handshake_timeout must be positive");
  require(io_timeout.count() > 0, "io_timeout must be positive");
  require(session_retries >= 0, "session_retries must not be negative");
  require(progress_interval.count() > 0, "progress_interval must be positive");
  require(passcode_length >= PasscodeAuthority::kMinLength &&
          passcode_length <= PasscodeAuthority::kMaxLength,
          "passcode_length must be between " + std::to_string(PasscodeAuthority::kMinLength) +
          " and " + std::to_string(PasscodeAuthority::kMaxLength));
  require(is_ip_address(bind_address), "bind_address '" + bind_address + "' is not an IP address");
  if(discovery_mode == DiscoveryMode::Broadcast) {
    require(discovery_port != 0, "discovery_port must be set in broadcast mode");
    require(is_ip_address(broadcast_address),
            "broadcast_address '" + broadcast_address + "' is not an IP address");
  }
}

TransferConfig TransferConfig::from_settings(const SettingsManager& settings) {
  TransferConfig config;
  config.chunk_size = static_cast<std::size_t>(settings.get<int>("chunk_size"));

  const auto mode = settings.get<std::string>("discovery_mode");
  if(mode == "direct") {
    config.discovery_mode = DiscoveryMode::Direct;
  } else if(mode == "broadcast") {
    config.discovery_mode = DiscoveryMode::Broadcast;
  } else {
    require(false, "unknown discovery_mode '" + mode + "'");
  }

  config.retry_budget = settings.get<int>("retry_budget");
  config.retry_interval = std::chrono::milliseconds(settings.get<int>("retry_interval_ms"));
  config.handshake_timeout = std::chrono::milliseconds(settings.get<int>("handshake_timeout_ms"));
  config.io_timeout = std::chrono::milliseconds(settings.get<int>("io_timeout_ms"));
  config.session_retries = settings.get<int>("session_retries");

  config.bind_address = settings.get<std::string>("bind_address");
  config.peer_address = settings.get<std::string>("peer_address");
  config.broadcast_address = settings.get<std::string>("broadcast_address");

  int transfer_port = settings.get<int>("transfer_port");
  int discovery_port = settings.get<int>("discovery_port");
  require(transfer_port >= 0 && transfer_port <= 65535, "transfer_port out of range");
  require(discovery_port >= 0 && discovery_port <= 65535, "discovery_port out of range");
  config.transfer_port = static_cast<uint16_t>(transfer_port);
  config.discovery_port = static_cast<uint16_t>(discovery_port);

  auto alphabet = parse_passcode_alphabet(settings.get<std::string>("passcode_alphabet"));
  require(alphabet.has_value(),
          "unknown passcode_alphabet '" + settings.get<std::string>("passcode_alphabet") + "'");
  config.passcode_alphabet = *alphabet;
  int length = settings.get<int>("passcode_length");
  require(length > 0, "passcode_length must be positive");
  config.passcode_length = static_cast<std::size_t>(length);
  config.passcode = settings.get<std::string>("passcode");

  config.output_dir = settings.get<std::string>("output_dir");
  config.atomic_write = settings.get<bool>("atomic_write");
  config.progress_interval = std::chrono::milliseconds(settings.get<int>("progress_interval_ms"));

  config.validate();
  return config;
}
