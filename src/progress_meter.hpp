#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "transfer_engine.hpp"

// One-line terminal meter fed from TransferProgress events:
//   Sending report.pdf [#####v....] 48.2%  12.3 MiB / 25.5 MiB  4.1 MiB/s
class ProgressMeter {
public:
  ProgressMeter(std::ostream& out, std::size_t width, std::string label);

  void update(const TransferProgress& progress);
  // Clears the meter line and moves to a fresh one. No-op if nothing was drawn.
  void finish();

  std::string format(const TransferProgress& progress) const;
  static std::string format_bar(uint64_t done, uint64_t total, std::size_t slots);

private:
  std::ostream& out_;
  std::size_t width_;
  std::string label_;
  std::size_t line_width_ = 0;
};
