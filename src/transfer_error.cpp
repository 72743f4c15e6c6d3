#include "transfer_error.hpp"

#include <asio/error.hpp>

#include <fmt/format.h>

const char* to_string(TransferErrorKind kind) {
  switch(kind) {
    case TransferErrorKind::FileNotFound: return "FileNotFound";
    case TransferErrorKind::InvalidPasscode: return "InvalidPasscode";
    case TransferErrorKind::PasscodeRejected: return "PasscodeRejected";
    case TransferErrorKind::ConnectionFailed: return "ConnectionFailed";
    case TransferErrorKind::Timeout: return "Timeout";
    case TransferErrorKind::FileExists: return "FileExists";
    case TransferErrorKind::IncompleteTransfer: return "IncompleteTransfer";
    case TransferErrorKind::TransferError: return "TransferError";
    case TransferErrorKind::LocalIoError: return "LocalIoError";
    case TransferErrorKind::Cancelled: return "Cancelled";
    case TransferErrorKind::InvalidConfig: return "InvalidConfig";
  }
  return "Unknown";
}

std::string TransferError::describe() const {
  std::string out = fmt::format("{}: {}", to_string(kind), message);
  if(kind == TransferErrorKind::IncompleteTransfer) {
    out += fmt::format(" ({} of {} bytes)", bytes_received, bytes_expected);
  }
  if(cause) {
    out += fmt::format(" [{}]", cause.message());
  }
  return out;
}

TransferError make_error(TransferErrorKind kind, std::string message) {
  TransferError error;
  error.kind = kind;
  error.message = std::move(message);
  return error;
}

TransferError incomplete_transfer(uint64_t received, uint64_t expected) {
  TransferError error = make_error(TransferErrorKind::IncompleteTransfer,
                                   "stream ended before the declared file size");
  error.bytes_received = received;
  error.bytes_expected = expected;
  return error;
}

TransferError network_error(const std::error_code& ec, const std::string& context) {
  TransferError error;
  error.cause = ec;
  error.message = context;
  if(ec == asio::error::timed_out) {
    error.kind = TransferErrorKind::Timeout;
    error.retryable = true;
  } else if(ec == asio::error::connection_refused ||
            ec == asio::error::host_unreachable ||
            ec == asio::error::network_unreachable ||
            ec == asio::error::host_not_found ||
            ec == asio::error::address_in_use ||
            ec == asio::error::address_not_available) {
    error.kind = TransferErrorKind::ConnectionFailed;
  } else if(ec == asio::error::operation_aborted) {
    error.kind = TransferErrorKind::Cancelled;
  } else {
    // reset, broken pipe, eof mid-operation and friends
    error.kind = TransferErrorKind::TransferError;
    error.retryable = true;
  }
  return error;
}

TransferError local_io_error(const std::error_code& ec, const std::filesystem::path& path) {
  TransferError error;
  error.cause = ec;
  if(ec == std::errc::no_such_file_or_directory) {
    error.kind = TransferErrorKind::FileNotFound;
    error.message = fmt::format("{} does not exist", path.string());
  } else if(ec == std::errc::file_exists) {
    error.kind = TransferErrorKind::FileExists;
    error.message = fmt::format("{} already exists", path.string());
  } else {
    error.kind = TransferErrorKind::LocalIoError;
    error.message = fmt::format("I/O error on {}", path.string());
  }
  return error;
}

TransferFailure::TransferFailure(TransferError error)
  : std::runtime_error(error.describe()), error_(std::move(error)) {}
