#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "protocol.hpp"
#include "transfer_config.hpp"
#include "transport_session.hpp"
#include "utils.hpp"

class Logger;

struct TransferProgress {
  uint64_t bytes_moved = 0;
  uint64_t total_bytes = 0;
  std::chrono::milliseconds elapsed{0};
  bool finished = false;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

struct TransferOutcome {
  std::string filename;
  std::filesystem::path path;  // source on the sender, destination on the receiver
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
  std::chrono::milliseconds elapsed{0};
  std::string sha256;
  std::string session_token;
  std::string peer;
};

// Header exchange and chunk loop over one TransportSession. Each send() or
// receive() call owns its TransferState; nothing survives between calls
// except the path of an unfinished destination file.
class ChunkedTransferEngine {
public:
  ChunkedTransferEngine(const TransferConfig& config, std::shared_ptr<Logger> logger);

  void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

  // wire_name defaults to the source's file name.
  TransferOutcome send(TransportSession& session,
                       const std::filesystem::path& source,
                       const std::string& wire_name = std::string());
  TransferOutcome receive(TransportSession& session, const std::filesystem::path& output_dir);

  // Deletes the file the last receive() created if it did not complete.
  void discard_partial();
  const std::filesystem::path& partial_path() const { return partial_path_; }

  // Reduces a peer-supplied name to its last path component. Throws
  // TransferFailure(TransferError) for empty, "." and "..".
  static std::string sanitize_filename(const std::string& name);
  static std::filesystem::path temp_path_for(const std::filesystem::path& output_dir, const std::string& filename);

private:
  struct TransferState {
    explicit TransferState(uint64_t total)
      : total_bytes(total), started_at(std::chrono::steady_clock::now()) {}

    uint64_t bytes_moved = 0;
    uint64_t total_bytes = 0;
    std::chrono::steady_clock::time_point started_at;
    std::chrono::steady_clock::time_point last_progress;
    bool progress_emitted = false;
    Sha256Accumulator digest;
  };

  TransferHeader read_header(TransportSession& session);
  void report(TransferState& state, bool final_event);
  TransferOutcome make_outcome(TransferState& state, const std::string& filename,
                               const std::filesystem::path& path, const TransportSession& session) const;

  const TransferConfig& config_;
  std::shared_ptr<Logger> logger_;
  ProgressCallback progress_callback_;
  std::filesystem::path partial_path_;
};
