#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <string>

#include "discovery.hpp"
#include "passcode.hpp"
#include "protocol.hpp"
#include "transfer_config.hpp"
#include "transfer_error.hpp"
#include "transport_session.hpp"

class Logger;

enum class RendezvousState {
  Idle,
  Listening,     // sender: binding the transfer port
  AwaitingPeer,  // sender: accepting and checking passcodes
  Searching,     // receiver: looking for a sender
  Connecting,    // receiver: dialing a candidate and presenting the passcode
  Paired,
  Failed
};

const char* to_string(RendezvousState state);

struct PairedPeer {
  std::unique_ptr<TcpSession> session;
  std::string peer;
  std::string session_token;
};

// Turns a passcode into a connected TransportSession on either side.
// Single-threaded: every method runs on the thread pumping io, abort()
// included (CodedropClient posts it there).
class RendezvousService {
public:
  using StateListener = std::function<void(RendezvousState)>;

  RendezvousService(asio::io_context& io, const TransferConfig& config, std::shared_ptr<Logger> logger);
  ~RendezvousService();

  RendezvousService(const RendezvousService&) = delete;
  RendezvousService& operator=(const RendezvousService&) = delete;

  // Sender: listen, announce, and keep checking incoming passcodes until one
  // matches or the retry budget runs out (Timeout). Wrong passcodes only
  // close the offending connection.
  PairedPeer await_peer(const Passcode& passcode, RendezvousAnnouncement announcement);

  // Receiver: find a sender, present the passcode, and wait for the sender
  // to start talking. Retries within the budget, then fails with
  // PasscodeRejected, ConnectionFailed or Timeout.
  PairedPeer find_peer(const Passcode& passcode);

  void abort();

  RendezvousState state() const { return state_; }
  uint16_t listening_port() const { return listening_port_; }
  std::size_t rejected_attempts() const { return rejected_attempts_; }
  void set_state_listener(StateListener listener) { state_listener_ = std::move(listener); }

private:
  struct PendingHandshake;

  void set_state(RendezvousState state);
  void check_aborted() const;
  bool try_listen();
  void start_accept();
  void begin_handshake(asio::ip::tcp::socket socket);
  void finish_handshake(const std::shared_ptr<PendingHandshake>& pending, const std::error_code& ec);
  void close_listener();
  void drain();
  void wait_until(std::chrono::steady_clock::time_point deadline);
  TransferFailure fail(TransferError error);

  asio::io_context& io_;
  const TransferConfig& config_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<DiscoveryStrategy> discovery_;
  RendezvousState state_ = RendezvousState::Idle;
  StateListener state_listener_;

  // sender
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::list<std::shared_ptr<PendingHandshake>> pending_;
  std::optional<asio::ip::tcp::socket> paired_socket_;
  std::string paired_peer_;
  std::error_code last_bind_error_;
  uint16_t listening_port_ = 0;
  std::size_t rejected_attempts_ = 0;

  // receiver
  TcpSession* connecting_ = nullptr;

  const Passcode* expected_ = nullptr;
  bool paired_ = false;
  bool aborted_ = false;
  bool wake_ = false;  // paired_ || aborted_, pumped on by run_until
  std::size_t outstanding_ = 0;
};
