#pragma once
#include <asio.hpp>

#include <chrono>

// Pumps io on the calling thread until done becomes true or the deadline
// passes. Returns false on deadline. A work guard keeps run_one_until
// blocking even when the caller's operation is the only outstanding work.
inline bool run_until(asio::io_context& io,
                      const bool& done,
                      std::chrono::steady_clock::time_point deadline) {
  auto guard = asio::make_work_guard(io);
  while(!done) {
    if(std::chrono::steady_clock::now() >= deadline) return false;
    if(io.stopped()) io.restart();
    io.run_one_until(deadline);
  }
  return true;
}

// Runs handlers until done is set; used after closing a socket so the
// aborted completion handler has run before its stack state goes away.
inline void drain_until(asio::io_context& io, const bool& done) {
  while(!done) {
    if(io.stopped()) io.restart();
    io.run_one();
  }
}
