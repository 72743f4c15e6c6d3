#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

enum class TransferErrorKind {
  FileNotFound,
  InvalidPasscode,
  PasscodeRejected,
  ConnectionFailed,
  Timeout,
  FileExists,
  IncompleteTransfer,
  TransferError,
  LocalIoError,
  Cancelled,
  InvalidConfig
};

const char* to_string(TransferErrorKind kind);

struct TransferError {
  TransferErrorKind kind = TransferErrorKind::TransferError;
  std::string message;
  uint64_t bytes_received = 0;  // IncompleteTransfer only
  uint64_t bytes_expected = 0;  // IncompleteTransfer only
  std::error_code cause;
  // Transient network fault: the session may be re-established and the
  // transfer restarted from byte 0.
  bool retryable = false;

  std::string describe() const;
};

TransferError make_error(TransferErrorKind kind, std::string message);
TransferError incomplete_transfer(uint64_t received, uint64_t expected);

// Conversions from lower-level failures.
TransferError network_error(const std::error_code& ec, const std::string& context);
TransferError local_io_error(const std::error_code& ec, const std::filesystem::path& path);

// Carries a TransferError through the core; CodedropClient converts it back
// into a TransferResult at the API boundary.
class TransferFailure : public std::runtime_error {
public:
  explicit TransferFailure(TransferError error);

  const TransferError& error() const noexcept { return error_; }
  TransferErrorKind kind() const noexcept { return error_.kind; }

private:
  TransferError error_;
};
