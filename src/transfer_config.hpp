#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "passcode.hpp"

class SettingsManager;

enum class DiscoveryMode { Direct, Broadcast };

const char* to_string(DiscoveryMode mode);

struct TransferConfig {
  static constexpr std::size_t kDefaultChunkSize = 64 * 1024;
  static constexpr std::size_t kMaxChunkSize = 16 * 1024 * 1024;

  std::size_t chunk_size = kDefaultChunkSize;
  DiscoveryMode discovery_mode = DiscoveryMode::Broadcast;

  // Rendezvous: retry_budget attempts spaced retry_interval apart.
  int retry_budget = 30;
  std::chrono::milliseconds retry_interval{1000};
  std::chrono::milliseconds handshake_timeout{5000};
  std::chrono::milliseconds io_timeout{120000};
  int session_retries = 3;

  std::string bind_address = "0.0.0.0";
  std::string peer_address;
  std::string broadcast_address = "255.255.255.255";
  uint16_t transfer_port = 9527;
  uint16_t discovery_port = 9528;

  PasscodeAlphabet passcode_alphabet = PasscodeAlphabet::Digits;
  std::size_t passcode_length = PasscodeAuthority::kDefaultLength;
  std::string passcode;  // preset sender passcode, generated when empty

  std::filesystem::path output_dir = ".";
  bool atomic_write = false;
  std::chrono::milliseconds progress_interval{100};

  // Throws TransferFailure(InvalidConfig).
  void validate() const;

  static TransferConfig from_settings(const SettingsManager& settings);
};
