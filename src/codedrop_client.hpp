#pragma once
#include <asio.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "rendezvous.hpp"
#include "transfer_config.hpp"
#include "transfer_engine.hpp"
#include "transfer_error.hpp"

class Logger;

struct TransferResult {
  std::optional<TransferOutcome> outcome;
  std::optional<TransferError> error;

  bool ok() const { return outcome.has_value(); }
};

// Entry point for one transfer at a time. Owns the io_context and runs it
// on the thread calling start_send/start_receive.
class CodedropClient {
public:
  using PasscodeCallback = std::function<void(const std::string& passcode)>;
  using StateCallback = std::function<void(RendezvousState)>;

  explicit CodedropClient(TransferConfig config, std::shared_ptr<Logger> logger = nullptr);
  ~CodedropClient();

  CodedropClient(const CodedropClient&) = delete;
  CodedropClient& operator=(const CodedropClient&) = delete;

  TransferResult start_send(const std::filesystem::path& source);
  TransferResult start_receive(const std::string& passcode);

  void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
  // Called once on the sender with the passcode to show the operator,
  // before the rendezvous starts waiting.
  void set_passcode_callback(PasscodeCallback callback) { passcode_callback_ = std::move(callback); }
  void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }

  // May be called from any thread, including a signal handler strand.
  void cancel();
  bool cancelled() const { return cancelled_.load(); }

  asio::io_context& io() { return io_; }
  const TransferConfig& config() const { return config_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  class ActiveOperation;

  TransferResult guarded(const char* what, const std::function<TransferOutcome()>& body);
  bool should_retry(const TransferFailure& failure, int attempt) const;
  void check_cancelled() const;

  TransferConfig config_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::atomic<bool> cancelled_{false};

  ProgressCallback progress_callback_;
  PasscodeCallback passcode_callback_;
  StateCallback state_callback_;

  // Only touched on the io thread.
  RendezvousService* active_rendezvous_ = nullptr;
  TransportSession* active_session_ = nullptr;
};
