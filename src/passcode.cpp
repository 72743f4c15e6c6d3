#include "passcode.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

#include <fmt/format.h>

namespace {

constexpr const char* kDigits = "0123456789";
constexpr const char* kUpper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr const char* kLower = "abcdefghijklmnopqrstuvwxyz";

std::string characters_for(PasscodeAlphabet alphabet) {
  switch(alphabet) {
    case PasscodeAlphabet::Digits: return kDigits;
    case PasscodeAlphabet::Alphanumeric: return std::string(kDigits) + kUpper + kLower;
    case PasscodeAlphabet::UpperAlphanumeric: return std::string(kDigits) + kUpper;
  }
  return kDigits;
}

} // namespace

std::optional<PasscodeAlphabet> parse_passcode_alphabet(const std::string& name) {
  if(name == "digits") return PasscodeAlphabet::Digits;
  if(name == "alphanumeric") return PasscodeAlphabet::Alphanumeric;
  if(name == "upper_alphanumeric") return PasscodeAlphabet::UpperAlphanumeric;
  return std::nullopt;
}

const char* to_string(PasscodeAlphabet alphabet) {
  switch(alphabet) {
    case PasscodeAlphabet::Digits: return "digits";
    case PasscodeAlphabet::Alphanumeric: return "alphanumeric";
    case PasscodeAlphabet::UpperAlphanumeric: return "upper_alphanumeric";
  }
  return "digits";
}

bool Passcode::matches(const char* data, std::size_t size) const {
  return size == value_.size() && std::memcmp(data, value_.data(), size) == 0;
}

PasscodeAuthority::PasscodeAuthority(PasscodeAlphabet alphabet, std::size_t length)
  : alphabet_(alphabet),
    length_(length),
    characters_(characters_for(alphabet)),
    rng_(std::random_device{}()) {
  if(length_ < kMinLength || length_ > kMaxLength) {
    throw std::invalid_argument(fmt::format("passcode length must be between {} and {}",
                                            kMinLength, kMaxLength));
  }
}

Passcode PasscodeAuthority::generate() {
  std::uniform_int_distribution<std::size_t> pick(0, characters_.size() - 1);
  std::string value;
  value.reserve(length_);
  for(std::size_t i = 0; i < length_; ++i) {
    value.push_back(characters_[pick(rng_)]);
  }
  return Passcode(std::move(value));
}

std::optional<Passcode> PasscodeAuthority::validate(const std::string& candidate,
                                                    std::string* reason) const {
  std::string value = candidate;
  if(alphabet_ == PasscodeAlphabet::UpperAlphanumeric) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  }
  if(value.size() != length_) {
    if(reason) {
      *reason = fmt::format("passcode must be {} characters, got {}", length_, value.size());
    }
    return std::nullopt;
  }
  for(std::size_t i = 0; i < value.size(); ++i) {
    if(characters_.find(value[i]) == std::string::npos) {
      if(reason) {
        *reason = fmt::format("character {} ('{}') is not in the {} alphabet",
                              i + 1, value[i], to_string(alphabet_));
      }
      return std::nullopt;
    }
  }
  return Passcode(std::move(value));
}

std::string PasscodeAuthority::make_session_token() {
  static constexpr char kHex[] = "0123456789abcdef";
  std::uniform_int_distribution<int> nibble(0, 15);
  std::string token;
  token.reserve(32);
  for(int i = 0; i < 32; ++i) {
    token.push_back(kHex[nibble(rng_)]);
  }
  return token;
}
