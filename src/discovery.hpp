#pragma once
#include <asio.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "passcode.hpp"
#include "protocol.hpp"
#include "transfer_config.hpp"

class Logger;

struct DiscoveredSender {
  asio::ip::tcp::endpoint endpoint;
  std::string session_token;
  std::string filename;
  uint64_t file_size = 0;
};

// How a sender makes itself findable and how a receiver finds the sender's
// transfer endpoint. Adding a transport means adding a strategy; the
// passcode handshake and the stream stay the same.
class DiscoveryStrategy {
public:
  virtual ~DiscoveryStrategy() = default;

  // Sender side, once per retry interval while waiting for a receiver.
  virtual void announce(const RendezvousAnnouncement& announcement) = 0;

  // Receiver side. Returns nullopt if no candidate turned up before the
  // deadline. Announcements for other passcodes are skipped silently.
  virtual std::optional<DiscoveredSender> next_candidate(const Passcode& passcode,
                                                         std::chrono::steady_clock::time_point deadline) = 0;

  virtual void close() = 0;
  virtual const char* name() const = 0;
};

class DirectDiscovery : public DiscoveryStrategy {
public:
  DirectDiscovery(const TransferConfig& config, std::shared_ptr<Logger> logger);

  void announce(const RendezvousAnnouncement& announcement) override;
  std::optional<DiscoveredSender> next_candidate(const Passcode& passcode,
                                                 std::chrono::steady_clock::time_point deadline) override;
  void close() override {}
  const char* name() const override { return "direct"; }

private:
  const TransferConfig& config_;
  std::shared_ptr<Logger> logger_;
};

class BroadcastDiscovery : public DiscoveryStrategy {
public:
  static constexpr std::size_t kMaxDatagram = 64 * 1024;

  BroadcastDiscovery(asio::io_context& io, const TransferConfig& config, std::shared_ptr<Logger> logger);
  ~BroadcastDiscovery() override;

  void announce(const RendezvousAnnouncement& announcement) override;
  std::optional<DiscoveredSender> next_candidate(const Passcode& passcode,
                                                 std::chrono::steady_clock::time_point deadline) override;
  void close() override;
  const char* name() const override { return "broadcast"; }

private:
  void open_sender_socket();
  void open_listener_socket();

  asio::io_context& io_;
  const TransferConfig& config_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<asio::ip::udp::socket> socket_;
  std::unique_ptr<std::array<char, kMaxDatagram>> buffer_;
  bool closed_ = false;
};

std::unique_ptr<DiscoveryStrategy> make_discovery(asio::io_context& io,
                                                  const TransferConfig& config,
                                                  std::shared_ptr<Logger> logger);
