#include "transfer_engine.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "log.hpp"
#include "transfer_error.hpp"

namespace fs = std::filesystem;

namespace {

std::error_code last_system_error() {
  return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

}

ChunkedTransferEngine::ChunkedTransferEngine(const TransferConfig& config, std::shared_ptr<Logger> logger)
  : config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("engine")) {}

std::string ChunkedTransferEngine::sanitize_filename(const std::string& name) {
  auto slash = name.find_last_of("/\\");
  std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
  if(base.empty() || base == "." || base == "..") {
    throw TransferFailure(make_error(TransferErrorKind::TransferError,
                                     "peer sent an unusable filename '" + name + "'"));
  }
  return base;
}

fs::path ChunkedTransferEngine::temp_path_for(const fs::path& output_dir, const std::string& filename) {
  return output_dir / ("." + filename + ".codedrop-part");
}

void ChunkedTransferEngine::report(TransferState& state, bool final_event) {
  const auto now = std::chrono::steady_clock::now();
  if(!final_event && state.progress_emitted && now - state.last_progress < config_.progress_interval) {
    return;
  }
  state.last_progress = now;
  state.progress_emitted = true;
  if(!progress_callback_) return;
  TransferProgress progress;
  progress.bytes_moved = state.bytes_moved;
  progress.total_bytes = state.total_bytes;
  progress.elapsed = since(state.started_at);
  progress.finished = final_event;
  try {
    progress_callback_(progress);
  } catch(const std::exception& e) {
    logger_->warn("Progress callback threw: {}", e.what());
  }
}

TransferOutcome ChunkedTransferEngine::make_outcome(TransferState& state,
                                                    const std::string& filename,
                                                    const fs::path& path,
                                                    const TransportSession& session) const {
  TransferOutcome outcome;
  outcome.filename = filename;
  outcome.path = path;
  outcome.bytes_transferred = state.bytes_moved;
  outcome.total_bytes = state.total_bytes;
  outcome.elapsed = since(state.started_at);
  outcome.sha256 = state.digest.hex_digest();
  outcome.peer = session.peer_description();
  return outcome;
}

TransferOutcome ChunkedTransferEngine::send(TransportSession& session,
                                            const fs::path& source,
                                            const std::string& wire_name) {
  std::error_code ec;
  if(!fs::is_regular_file(source, ec)) {
    throw TransferFailure(make_error(TransferErrorKind::FileNotFound,
                                     "'" + source.string() + "' is not a readable file"));
  }
  const uint64_t file_size = fs::file_size(source, ec);
  if(ec) {
    throw TransferFailure(local_io_error(ec, source));
  }
  std::ifstream in(source, std::ios::binary);
  if(!in) {
    throw TransferFailure(local_io_error(last_system_error(), source));
  }

  TransferHeader header;
  header.file_size = file_size;
  header.filename = wire_name.empty() ? source.filename().string() : wire_name;
  std::vector<char> encoded;
  try {
    encoded = encode_header(header);
  } catch(const std::invalid_argument& e) {
    throw TransferFailure(make_error(TransferErrorKind::TransferError, e.what()));
  }

  logger_->info("Sending {} ({}) to {}", header.filename, format_bytes(file_size), session.peer_description());
  session.write_all(encoded.data(), encoded.size(), config_.handshake_timeout);

  TransferState state(file_size);
  std::vector<char> buffer(config_.chunk_size);
  while(state.bytes_moved < file_size) {
    const auto want = static_cast<std::size_t>(
      std::min<uint64_t>(config_.chunk_size, file_size - state.bytes_moved));
    in.read(buffer.data(), static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(in.gcount());
    if(got == 0) {
      if(in.bad()) {
        throw TransferFailure(local_io_error(last_system_error(), source));
      }
      break;
    }
    session.write_all(buffer.data(), got, config_.io_timeout);
    state.bytes_moved += got;
    state.digest.update(buffer.data(), got);
    report(state, false);
  }
  if(state.bytes_moved != file_size) {
    throw TransferFailure(incomplete_transfer(state.bytes_moved, file_size));
  }
  report(state, true);
  if(!session.finish(config_.handshake_timeout)) {
    throw TransferFailure(make_error(TransferErrorKind::TransferError,
                                     "receiver did not confirm the end of the transfer"));
  }

  auto outcome = make_outcome(state, header.filename, source, session);
  logger_->info("Sent {} in {} ms (sha256 {})", format_bytes(outcome.bytes_transferred),
                outcome.elapsed.count(), outcome.sha256);
  return outcome;
}

TransferHeader ChunkedTransferEngine::read_header(TransportSession& session) {
  std::array<unsigned char, kFixedHeaderBytes> fixed{};
  auto got = session.read_exact(reinterpret_cast<char*>(fixed.data()), fixed.size(), config_.handshake_timeout);
  if(got != fixed.size()) {
    throw TransferFailure(make_error(TransferErrorKind::TransferError,
                                     fmt::format("connection closed after {} of {} header bytes",
                                                 got, fixed.size())));
  }
  TransferHeader header;
  uint64_t name_length = 0;
  try {
    auto decoded = decode_fixed_header(fixed);
    header.file_size = decoded.first;
    name_length = decoded.second;
  } catch(const std::invalid_argument& e) {
    throw TransferFailure(make_error(TransferErrorKind::TransferError,
                                     std::string("malformed header: ") + e.what()));
  }
  header.filename.resize(static_cast<std::size_t>(name_length));
  got = session.read_exact(&header.filename[0], header.filename.size(), config_.handshake_timeout);
  if(got != header.filename.size()) {
    throw TransferFailure(make_error(TransferErrorKind::TransferError,
                                     "connection closed inside the header filename"));
  }
  return header;
}

TransferOutcome ChunkedTransferEngine::receive(TransportSession& session, const fs::path& output_dir) {
  partial_path_.clear();
  const auto header = read_header(session);
  const auto filename = sanitize_filename(header.filename);
  const auto final_path = output_dir / filename;

  std::error_code ec;
  if(fs::exists(final_path, ec)) {
    throw TransferFailure(make_error(TransferErrorKind::FileExists,
                                     "'" + final_path.string() + "' already exists"));
  }
  const auto write_path = config_.atomic_write ? temp_path_for(output_dir, filename) : final_path;
  std::ofstream out(write_path, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw TransferFailure(local_io_error(last_system_error(), write_path));
  }
  partial_path_ = write_path;
  logger_->info("Receiving {} ({}) from {}", filename, format_bytes(header.file_size),
                session.peer_description());

  TransferState state(header.file_size);
  std::vector<char> buffer(config_.chunk_size);
  while(state.bytes_moved < header.file_size) {
    const auto want = static_cast<std::size_t>(
      std::min<uint64_t>(config_.chunk_size, header.file_size - state.bytes_moved));
    const auto got = session.read_some(buffer.data(), want, config_.io_timeout);
    if(got == 0) break;
    out.write(buffer.data(), static_cast<std::streamsize>(got));
    if(!out) {
      throw TransferFailure(local_io_error(last_system_error(), write_path));
    }
    state.bytes_moved += got;
    state.digest.update(buffer.data(), got);
    report(state, false);
  }
  if(state.bytes_moved != header.file_size) {
    throw TransferFailure(incomplete_transfer(state.bytes_moved, header.file_size));
  }
  report(state, true);
  out.close();
  if(!out) {
    throw TransferFailure(local_io_error(last_system_error(), write_path));
  }
  if(write_path != final_path) {
    fs::rename(write_path, final_path, ec);
    if(ec) {
      throw TransferFailure(local_io_error(ec, final_path));
    }
  }
  partial_path_.clear();
  session.close();

  auto outcome = make_outcome(state, filename, final_path, session);
  logger_->info("Received {} in {} ms (sha256 {})", format_bytes(outcome.bytes_transferred),
                outcome.elapsed.count(), outcome.sha256);
  return outcome;
}

void ChunkedTransferEngine::discard_partial() {
  if(partial_path_.empty()) return;
  std::error_code ec;
  fs::remove(partial_path_, ec);
  if(ec) {
    logger_->warn("Could not remove partial file {}: {}", partial_path_.string(), ec.message());
  } else {
    logger_->debug("Removed partial file {}", partial_path_.string());
  }
  partial_path_.clear();
}
