#include "codedrop_client.hpp"

#include <system_error>

#include "log.hpp"
#include "passcode.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

// Publishes the rendezvous and session of the current attempt to cancel().
// Declared after the RendezvousService it tracks so the pointers are reset
// before the service drains its handlers on destruction.
class CodedropClient::ActiveOperation {
public:
  ActiveOperation(CodedropClient& client, RendezvousService& rendezvous)
    : client_(client) {
    client_.active_rendezvous_ = &rendezvous;
  }
  ~ActiveOperation() {
    client_.active_rendezvous_ = nullptr;
    client_.active_session_ = nullptr;
  }

  void attach(TransportSession& session) {
    client_.active_session_ = &session;
  }

private:
  CodedropClient& client_;
};

CodedropClient::CodedropClient(TransferConfig config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("codedrop")) {}

CodedropClient::~CodedropClient() = default;

void CodedropClient::cancel() {
  if(cancelled_.exchange(true)) return;
  asio::post(io_, [this]{
    logger_->info("Cancelling transfer");
    if(active_rendezvous_) active_rendezvous_->abort();
    if(active_session_) active_session_->close();
  });
}

void CodedropClient::check_cancelled() const {
  if(cancelled_.load()) {
    throw TransferFailure(make_error(TransferErrorKind::Cancelled, "transfer cancelled"));
  }
}

bool CodedropClient::should_retry(const TransferFailure& failure, int attempt) const {
  if(cancelled_.load()) return false;
  if(!failure.error().retryable) return false;
  return attempt < config_.session_retries;
}

TransferResult CodedropClient::guarded(const char* what, const std::function<TransferOutcome()>& body) {
  TransferResult result;
  try {
    result.outcome = body();
    return result;
  } catch(const TransferFailure& failure) {
    result.error = failure.error();
  } catch(const std::system_error& e) {
    result.error = network_error(e.code(), what);
  }
  if(cancelled_.load() && result.error->kind != TransferErrorKind::Cancelled) {
    result.error->message = "cancelled (" + result.error->message + ")";
    result.error->kind = TransferErrorKind::Cancelled;
  }
  logger_->error("{} failed: {}", what, result.error->describe());
  return result;
}

TransferResult CodedropClient::start_send(const fs::path& source) {
  return guarded("send", [&]{
    check_cancelled();
    config_.validate();

    std::error_code ec;
    if(!fs::is_regular_file(source, ec)) {
      throw TransferFailure(make_error(TransferErrorKind::FileNotFound,
                                       "'" + source.string() + "' does not exist or is not a regular file"));
    }
    const auto file_size = fs::file_size(source, ec);
    if(ec) {
      throw TransferFailure(local_io_error(ec, source));
    }

    PasscodeAuthority authority(config_.passcode_alphabet, config_.passcode_length);
    std::optional<Passcode> passcode;
    if(config_.passcode.empty()) {
      passcode = authority.generate();
    } else {
      std::string reason;
      passcode = authority.validate(config_.passcode, &reason);
      if(!passcode) {
        throw TransferFailure(make_error(TransferErrorKind::InvalidPasscode, reason));
      }
    }

    RendezvousAnnouncement announcement;
    announcement.passcode = passcode->str();
    announcement.filename = source.filename().string();
    announcement.session_token = authority.make_session_token();
    announcement.file_size = file_size;

    logger_->info("Offering {} ({}) with passcode {} via {} discovery", announcement.filename,
                  format_bytes(file_size), passcode->str(), to_string(config_.discovery_mode));
    if(passcode_callback_) passcode_callback_(passcode->str());

    ChunkedTransferEngine engine(config_, logger_);
    engine.set_progress_callback(progress_callback_);
    for(int attempt = 0;; ++attempt) {
      check_cancelled();
      try {
        RendezvousService rendezvous(io_, config_, logger_);
        rendezvous.set_state_listener(state_callback_);
        ActiveOperation active(*this, rendezvous);
        auto peer = rendezvous.await_peer(*passcode, announcement);
        active.attach(*peer.session);
        auto outcome = engine.send(*peer.session, source, announcement.filename);
        outcome.session_token = peer.session_token;
        return outcome;
      } catch(const TransferFailure& failure) {
        if(!should_retry(failure, attempt)) throw;
        logger_->warn("Transfer interrupted ({}); restarting from byte 0 (retry {}/{})",
                      failure.error().describe(), attempt + 1, config_.session_retries);
      }
    }
  });
}

TransferResult CodedropClient::start_receive(const std::string& passcode_text) {
  return guarded("receive", [&]{
    check_cancelled();

    // Rejected before any network I/O.
    PasscodeAuthority authority(config_.passcode_alphabet, config_.passcode_length);
    std::string reason;
    auto passcode = authority.validate(passcode_text, &reason);
    if(!passcode) {
      throw TransferFailure(make_error(TransferErrorKind::InvalidPasscode, reason));
    }

    config_.validate();
    if(config_.discovery_mode == DiscoveryMode::Direct && config_.peer_address.empty()) {
      throw TransferFailure(make_error(TransferErrorKind::InvalidConfig,
                                       "direct discovery needs peer_address to receive"));
    }
    std::error_code ec;
    if(!fs::is_directory(config_.output_dir, ec)) {
      throw TransferFailure(make_error(TransferErrorKind::LocalIoError,
                                       "output_dir '" + config_.output_dir.string() + "' is not a directory"));
    }

    logger_->info("Looking for a sender with passcode {} via {} discovery", passcode->str(),
                  to_string(config_.discovery_mode));

    ChunkedTransferEngine engine(config_, logger_);
    engine.set_progress_callback(progress_callback_);
    for(int attempt = 0;; ++attempt) {
      check_cancelled();
      try {
        RendezvousService rendezvous(io_, config_, logger_);
        rendezvous.set_state_listener(state_callback_);
        ActiveOperation active(*this, rendezvous);
        auto peer = rendezvous.find_peer(*passcode);
        active.attach(*peer.session);
        auto outcome = engine.receive(*peer.session, config_.output_dir);
        outcome.session_token = peer.session_token;
        return outcome;
      } catch(const TransferFailure& failure) {
        if(!should_retry(failure, attempt)) throw;
        engine.discard_partial();
        logger_->warn("Transfer interrupted ({}); restarting from byte 0 (retry {}/{})",
                      failure.error().describe(), attempt + 1, config_.session_retries);
      }
    }
  });
}
