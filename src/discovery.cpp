#include "discovery.hpp"

#include <fmt/format.h>

#include "io_wait.hpp"
#include "log.hpp"
#include "transfer_error.hpp"

using udp = asio::ip::udp;
using tcp = asio::ip::tcp;

DirectDiscovery::DirectDiscovery(const TransferConfig& config, std::shared_ptr<Logger> logger)
  : config_(config), logger_(std::move(logger)) {}

void DirectDiscovery::announce(const RendezvousAnnouncement&) {
  // The receiver dials us; nothing to advertise.
}

std::optional<DiscoveredSender> DirectDiscovery::next_candidate(const Passcode&,
                                                                std::chrono::steady_clock::time_point) {
  std::error_code ec;
  auto address = asio::ip::make_address(config_.peer_address, ec);
  if(!ec) {
    return DiscoveredSender{tcp::endpoint(address, config_.transfer_port), std::string(), std::string(), 0};
  }
  // Host names go through the resolver; the first result wins.
  asio::io_context resolver_io;
  tcp::resolver resolver(resolver_io);
  auto results = resolver.resolve(config_.peer_address, std::to_string(config_.transfer_port), ec);
  if(ec || results.empty()) {
    if(!ec) ec = asio::error::make_error_code(asio::error::host_not_found);
    throw TransferFailure(network_error(ec, "resolve " + config_.peer_address));
  }
  return DiscoveredSender{results.begin()->endpoint(), std::string(), std::string(), 0};
}

BroadcastDiscovery::BroadcastDiscovery(asio::io_context& io,
                                       const TransferConfig& config,
                                       std::shared_ptr<Logger> logger)
  : io_(io), config_(config), logger_(std::move(logger)) {}

BroadcastDiscovery::~BroadcastDiscovery() {
  close();
}

void BroadcastDiscovery::open_sender_socket() {
  if(socket_) return;
  auto socket = std::make_unique<udp::socket>(io_);
  socket->open(udp::v4());
  socket->set_option(udp::socket::broadcast(true));
  socket_ = std::move(socket);
}

void BroadcastDiscovery::open_listener_socket() {
  if(socket_) return;
  auto address = asio::ip::make_address(config_.bind_address);
  udp::endpoint endpoint(address, config_.discovery_port);
  auto socket = std::make_unique<udp::socket>(io_);
  socket->open(endpoint.protocol());
  socket->set_option(udp::socket::reuse_address(true));
  std::error_code ec;
  socket->bind(endpoint, ec);
  if(ec) {
    throw TransferFailure(network_error(ec, fmt::format("bind discovery port {}", config_.discovery_port)));
  }
  buffer_ = std::make_unique<std::array<char, kMaxDatagram>>();
  socket_ = std::move(socket);
  logger_->debug("Listening for announcements on {}:{}", config_.bind_address, config_.discovery_port);
}

void BroadcastDiscovery::announce(const RendezvousAnnouncement& announcement) {
  if(closed_) return;
  open_sender_socket();
  auto payload = make_announcement(announcement).dump();
  std::error_code ec;
  udp::endpoint target(asio::ip::make_address(config_.broadcast_address, ec), config_.discovery_port);
  if(ec) {
    logger_->warn("Invalid broadcast address '{}': {}", config_.broadcast_address, ec.message());
    return;
  }
  socket_->send_to(asio::buffer(payload), target, 0, ec);
  if(ec) {
    logger_->warn("Announcement to {}:{} failed: {}",
                  config_.broadcast_address, config_.discovery_port, ec.message());
    return;
  }
  logger_->debug("Announced session {} on {}:{}",
                 announcement.session_token, config_.broadcast_address, config_.discovery_port);
}

std::optional<DiscoveredSender> BroadcastDiscovery::next_candidate(const Passcode& passcode,
                                                                   std::chrono::steady_clock::time_point deadline) {
  if(closed_) {
    throw TransferFailure(make_error(TransferErrorKind::Cancelled, "discovery closed"));
  }
  open_listener_socket();
  while(true) {
    bool done = false;
    std::error_code result;
    std::size_t received = 0;
    udp::endpoint from;
    socket_->async_receive_from(asio::buffer(*buffer_), from,
      [&](const std::error_code& ec, std::size_t n){
        result = ec;
        received = n;
        done = true;
      });
    if(!run_until(io_, done, deadline)) {
      std::error_code ignored;
      socket_->cancel(ignored);
      drain_until(io_, done);
      return std::nullopt;
    }
    if(result) {
      throw TransferFailure(network_error(result, "receive announcement"));
    }
    auto announcement = parse_announcement(std::string(buffer_->data(), received));
    if(!announcement) {
      logger_->debug("Ignoring non-announcement datagram from {}", from.address().to_string());
      continue;
    }
    if(!passcode.matches(announcement->passcode.data(), announcement->passcode.size())) {
      logger_->debug("Ignoring announcement for another passcode from {}", from.address().to_string());
      continue;
    }
    logger_->info("Found sender {} offering '{}' ({} bytes)",
                  from.address().to_string(), announcement->filename, announcement->file_size);
    return DiscoveredSender{tcp::endpoint(from.address(), announcement->transfer_port),
                            announcement->session_token,
                            announcement->filename,
                            announcement->file_size};
  }
}

void BroadcastDiscovery::close() {
  closed_ = true;
  if(socket_) {
    std::error_code ec;
    socket_->close(ec);
  }
}

std::unique_ptr<DiscoveryStrategy> make_discovery(asio::io_context& io,
                                                  const TransferConfig& config,
                                                  std::shared_ptr<Logger> logger) {
  if(config.discovery_mode == DiscoveryMode::Direct) {
    return std::make_unique<DirectDiscovery>(config, std::move(logger));
  }
  return std::make_unique<BroadcastDiscovery>(io, config, std::move(logger));
}
