#include "progress_meter.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

#include "utils.hpp"

ProgressMeter::ProgressMeter(std::ostream& out, std::size_t width, std::string label)
  : out_(out), width_(std::max<std::size_t>(1, width)), label_(std::move(label)) {}

std::string ProgressMeter::format_bar(uint64_t done, uint64_t total, std::size_t slots) {
  static constexpr char kMeterChars[] = {' ', '.', '_', 'v', 'Y', 'X', 'H', '#'};
  constexpr std::size_t kMeterCharCount = sizeof(kMeterChars) / sizeof(kMeterChars[0]);
  slots = std::max<std::size_t>(1, slots);
  std::string bar;
  bar.reserve(slots);
  if(total == 0) {
    bar.assign(slots, '#');
    return bar;
  }
  done = std::min(done, total);
  auto scaled_position = [total, slots](std::size_t idx) -> uint64_t {
    uint64_t base = (total / slots) * idx;
    uint64_t remainder = (total % slots) * idx / slots;
    return base + remainder;
  };
  for(std::size_t slot = 0; slot < slots; ++slot) {
    uint64_t slot_start = scaled_position(slot);
    uint64_t slot_end = std::min<uint64_t>(std::max(scaled_position(slot + 1), slot_start + 1), total);
    if(slot_start >= total) {
      bar.push_back(done == total ? '#' : ' ');
      continue;
    }
    uint64_t filled = done <= slot_start ? 0 : std::min(done, slot_end) - slot_start;
    if(filled >= slot_end - slot_start) {
      bar.push_back('#');
      continue;
    }
    double ratio = static_cast<double>(filled) / static_cast<double>(slot_end - slot_start);
    std::size_t index = static_cast<std::size_t>(ratio * static_cast<double>(kMeterCharCount - 1));
    bar.push_back(kMeterChars[std::min(index, kMeterCharCount - 2)]);
  }
  return bar;
}

std::string ProgressMeter::format(const TransferProgress& progress) const {
  double percent = progress.total_bytes == 0
    ? 100.0
    : (static_cast<double>(std::min(progress.bytes_moved, progress.total_bytes)) /
       static_cast<double>(progress.total_bytes)) * 100.0;
  double seconds = static_cast<double>(progress.elapsed.count()) / 1000.0;
  uint64_t rate = seconds > 0.0 ? static_cast<uint64_t>(static_cast<double>(progress.bytes_moved) / seconds) : 0;

  std::ostringstream oss;
  if(!label_.empty()) oss << label_ << " ";
  oss << "[" << format_bar(progress.bytes_moved, progress.total_bytes, width_) << "] "
      << std::fixed << std::setprecision(1) << percent << "%  "
      << format_bytes(progress.bytes_moved) << " / " << format_bytes(progress.total_bytes);
  if(rate > 0) oss << "  " << format_bytes(rate) << "/s";
  return oss.str();
}

void ProgressMeter::update(const TransferProgress& progress) {
  auto rendered = format(progress);
  out_ << "\r" << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
}

void ProgressMeter::finish() {
  if(line_width_ == 0) return;
  out_ << "\n";
  out_.flush();
  line_width_ = 0;
}
