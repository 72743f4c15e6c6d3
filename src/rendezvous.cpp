#include "rendezvous.hpp"

#include <vector>

#include <fmt/format.h>

#include "io_wait.hpp"
#include "log.hpp"

using tcp = asio::ip::tcp;

struct RendezvousService::PendingHandshake {
  PendingHandshake(asio::io_context& io, tcp::socket s)
    : socket(std::move(s)), timer(io) {}

  tcp::socket socket;
  asio::steady_timer timer;
  std::string peer;
  std::vector<char> buffer;
  bool finished = false;
};

const char* to_string(RendezvousState state) {
  switch(state) {
    case RendezvousState::Idle: return "Idle";
    case RendezvousState::Listening: return "Listening";
    case RendezvousState::AwaitingPeer: return "AwaitingPeer";
    case RendezvousState::Searching: return "Searching";
    case RendezvousState::Connecting: return "Connecting";
    case RendezvousState::Paired: return "Paired";
    case RendezvousState::Failed: return "Failed";
  }
  return "Unknown";
}

RendezvousService::RendezvousService(asio::io_context& io,
                                     const TransferConfig& config,
                                     std::shared_ptr<Logger> logger)
  : io_(io),
    config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("rendezvous")) {}

RendezvousService::~RendezvousService() {
  close_listener();
  if(discovery_) discovery_->close();
  drain();
}

void RendezvousService::set_state(RendezvousState state) {
  if(state_ == state) return;
  logger_->debug("Rendezvous {} -> {}", to_string(state_), to_string(state));
  state_ = state;
  if(state_listener_) state_listener_(state);
}

void RendezvousService::check_aborted() const {
  if(aborted_) {
    throw TransferFailure(make_error(TransferErrorKind::Cancelled, "rendezvous cancelled"));
  }
}

TransferFailure RendezvousService::fail(TransferError error) {
  set_state(RendezvousState::Failed);
  logger_->error("Rendezvous failed: {}", error.describe());
  return TransferFailure(std::move(error));
}

void RendezvousService::abort() {
  aborted_ = true;
  wake_ = true;
  close_listener();
  if(discovery_) discovery_->close();
  if(connecting_) connecting_->close();
}

void RendezvousService::wait_until(std::chrono::steady_clock::time_point deadline) {
  run_until(io_, aborted_, deadline);
}

void RendezvousService::drain() {
  while(outstanding_ > 0) {
    if(io_.stopped()) io_.restart();
    io_.run_one();
  }
}

// ---- sender ---------------------------------------------------------------

bool RendezvousService::try_listen() {
  std::error_code ec;
  tcp::endpoint endpoint(asio::ip::make_address(config_.bind_address, ec), config_.transfer_port);
  if(ec) {
    throw TransferFailure(make_error(TransferErrorKind::InvalidConfig,
                                     "invalid bind_address '" + config_.bind_address + "'"));
  }
  auto acceptor = std::make_unique<tcp::acceptor>(io_);
  acceptor->open(endpoint.protocol(), ec);
  if(!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor->bind(endpoint, ec);
  if(!ec) acceptor->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    last_bind_error_ = ec;
    logger_->warn("Cannot listen on {}:{}: {}", config_.bind_address, config_.transfer_port, ec.message());
    return false;
  }
  listening_port_ = acceptor->local_endpoint().port();
  acceptor_ = std::move(acceptor);
  logger_->info("Listening for the receiver on {}:{}", config_.bind_address, listening_port_);
  return true;
}

void RendezvousService::start_accept() {
  if(!acceptor_ || !acceptor_->is_open() || paired_ || aborted_) return;
  ++outstanding_;
  acceptor_->async_accept([this](const std::error_code& ec, tcp::socket socket){
    --outstanding_;
    if(ec) {
      if(ec != asio::error::operation_aborted) {
        logger_->warn("Accept failed: {}", ec.message());
        start_accept();
      }
      return;
    }
    begin_handshake(std::move(socket));
    start_accept();
  });
}

void RendezvousService::begin_handshake(tcp::socket socket) {
  auto pending = std::make_shared<PendingHandshake>(io_, std::move(socket));
  std::error_code ec;
  auto remote = pending->socket.remote_endpoint(ec);
  pending->peer = ec ? std::string("<unknown>") : describe_endpoint(remote);
  pending->buffer.resize(expected_->size());
  pending_.push_back(pending);
  logger_->debug("Connection attempt from {}", pending->peer);

  ++outstanding_;
  asio::async_read(pending->socket, asio::buffer(pending->buffer),
    [this, pending](const std::error_code& read_ec, std::size_t){
      --outstanding_;
      finish_handshake(pending, read_ec);
    });

  ++outstanding_;
  pending->timer.expires_after(config_.handshake_timeout);
  pending->timer.async_wait([this, pending](const std::error_code& timer_ec){
    --outstanding_;
    if(timer_ec || pending->finished) return;
    logger_->warn("{} did not present a passcode within {} ms", pending->peer,
                  config_.handshake_timeout.count());
    std::error_code ignored;
    pending->socket.close(ignored);
  });
}

void RendezvousService::finish_handshake(const std::shared_ptr<PendingHandshake>& pending,
                                         const std::error_code& ec) {
  pending->finished = true;
  pending->timer.cancel();
  pending_.remove(pending);
  std::error_code ignored;
  if(ec) {
    if(ec != asio::error::operation_aborted) {
      logger_->debug("Handshake with {} failed: {}", pending->peer, ec.message());
    }
    pending->socket.close(ignored);
    return;
  }
  if(paired_) {
    pending->socket.close(ignored);
    return;
  }
  // A genuine receiver sends the passcode and then waits for the header,
  // so anything queued past the passcode length is a longer string.
  std::error_code available_ec;
  const auto trailing = pending->socket.available(available_ec);
  if(available_ec || trailing != 0 ||
     !expected_->matches(pending->buffer.data(), pending->buffer.size())) {
    ++rejected_attempts_;
    logger_->warn("Rejected wrong passcode from {}", pending->peer);
    pending->socket.close(ignored);
    return;
  }
  logger_->info("Receiver {} presented the passcode", pending->peer);
  paired_socket_.emplace(std::move(pending->socket));
  paired_peer_ = pending->peer;
  paired_ = true;
  wake_ = true;
}

void RendezvousService::close_listener() {
  std::error_code ec;
  if(acceptor_) acceptor_->close(ec);
  for(auto& pending : pending_) {
    pending->timer.cancel();
    pending->socket.close(ec);
  }
  pending_.clear();
}

PairedPeer RendezvousService::await_peer(const Passcode& passcode, RendezvousAnnouncement announcement) {
  expected_ = &passcode;
  discovery_ = make_discovery(io_, config_, logger_);
  set_state(RendezvousState::Listening);

  try {
    for(int attempt = 1; attempt <= config_.retry_budget && !paired_; ++attempt) {
      check_aborted();
      const auto deadline = std::chrono::steady_clock::now() + config_.retry_interval;
      if(!acceptor_) {
        if(!try_listen()) {
          wait_until(deadline);
          continue;
        }
        announcement.transfer_port = listening_port_;
        set_state(RendezvousState::AwaitingPeer);
        start_accept();
      }
      discovery_->announce(announcement);
      run_until(io_, wake_, deadline);
    }
    check_aborted();
  } catch(const TransferFailure&) {
    close_listener();
    drain();
    set_state(RendezvousState::Failed);
    throw;
  }

  close_listener();
  discovery_->close();
  drain();

  if(!paired_) {
    if(listening_port_ == 0) {
      auto error = make_error(TransferErrorKind::Timeout,
                              fmt::format("could not listen on port {} after {} attempts",
                                          config_.transfer_port, config_.retry_budget));
      error.cause = last_bind_error_;
      throw fail(std::move(error));
    }
    throw fail(make_error(TransferErrorKind::Timeout,
                          fmt::format("no receiver presented the passcode after {} attempts ({} rejected)",
                                      config_.retry_budget, rejected_attempts_)));
  }

  set_state(RendezvousState::Paired);
  PairedPeer peer;
  peer.session = std::make_unique<TcpSession>(io_, std::move(*paired_socket_));
  paired_socket_.reset();
  peer.peer = paired_peer_;
  peer.session_token = announcement.session_token;
  return peer;
}

// ---- receiver -------------------------------------------------------------

PairedPeer RendezvousService::find_peer(const Passcode& passcode) {
  expected_ = &passcode;
  discovery_ = make_discovery(io_, config_, logger_);
  set_state(RendezvousState::Searching);

  std::size_t rejected = 0;
  std::size_t unreachable = 0;
  std::size_t stalled = 0;
  std::string last_failure;

  try {
    for(int attempt = 1; attempt <= config_.retry_budget; ++attempt) {
      check_aborted();
      const auto deadline = std::chrono::steady_clock::now() + config_.retry_interval;
      auto candidate = discovery_->next_candidate(passcode, deadline);
      if(!candidate) {
        logger_->debug("No sender found yet (attempt {}/{})", attempt, config_.retry_budget);
        continue;
      }

      set_state(RendezvousState::Connecting);
      const auto target = describe_endpoint(candidate->endpoint);
      try {
        auto session = TcpSession::connect(io_, candidate->endpoint, config_.handshake_timeout);
        connecting_ = session.get();
        session->write_all(passcode.str().data(), passcode.size(), config_.handshake_timeout);
        bool accepted = session->wait_readable(config_.handshake_timeout);
        connecting_ = nullptr;
        if(accepted) {
          logger_->info("Paired with sender {}", target);
          set_state(RendezvousState::Paired);
          PairedPeer peer;
          peer.session = std::move(session);
          peer.peer = target;
          peer.session_token = candidate->session_token;
          return peer;
        }
        ++rejected;
        last_failure = target + " closed the session after reading the passcode";
        logger_->warn("Sender {} rejected the passcode (attempt {}/{})", target, attempt, config_.retry_budget);
      } catch(const TransferFailure& failure) {
        connecting_ = nullptr;
        check_aborted();
        switch(failure.kind()) {
          case TransferErrorKind::ConnectionFailed: ++unreachable; break;
          case TransferErrorKind::Timeout: ++stalled; break;
          case TransferErrorKind::Cancelled: throw;
          default: ++unreachable; break;
        }
        last_failure = failure.error().describe();
        logger_->warn("Attempt {}/{} to reach {} failed: {}", attempt, config_.retry_budget, target,
                      failure.error().describe());
      }
      set_state(RendezvousState::Searching);
      wait_until(deadline);
    }
    check_aborted();
  } catch(const TransferFailure&) {
    connecting_ = nullptr;
    if(discovery_) discovery_->close();
    set_state(RendezvousState::Failed);
    throw;
  }

  discovery_->close();
  if(rejected > 0) {
    throw fail(make_error(TransferErrorKind::PasscodeRejected,
                          fmt::format("sender rejected the passcode {} time(s): {}", rejected, last_failure)));
  }
  if(unreachable > 0 || stalled > 0) {
    auto kind = unreachable > 0 ? TransferErrorKind::ConnectionFailed : TransferErrorKind::Timeout;
    throw fail(make_error(kind, fmt::format("could not pair after {} attempts: {}",
                                            config_.retry_budget, last_failure)));
  }
  throw fail(make_error(TransferErrorKind::Timeout,
                        fmt::format("no sender announced this passcode after {} attempts",
                                    config_.retry_budget)));
}
