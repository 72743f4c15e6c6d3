#pragma once

#include <cstddef>
#include <optional>
#include <random>
#include <string>

enum class PasscodeAlphabet {
  Digits,            // 0-9
  Alphanumeric,      // 0-9A-Za-z, case-sensitive
  UpperAlphanumeric  // 0-9A-Z, input is upper-cased before validation
};

std::optional<PasscodeAlphabet> parse_passcode_alphabet(const std::string& name);
const char* to_string(PasscodeAlphabet alphabet);

// A validated pairing token. Only PasscodeAuthority creates these.
class Passcode {
public:
  const std::string& str() const { return value_; }
  std::size_t size() const { return value_.size(); }

  bool matches(const char* data, std::size_t size) const;

  friend bool operator==(const Passcode& a, const Passcode& b) { return a.value_ == b.value_; }
  friend bool operator!=(const Passcode& a, const Passcode& b) { return !(a == b); }

private:
  friend class PasscodeAuthority;
  explicit Passcode(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

class PasscodeAuthority {
public:
  static constexpr std::size_t kDefaultLength = 6;
  static constexpr std::size_t kMinLength = 4;
  static constexpr std::size_t kMaxLength = 32;

  explicit PasscodeAuthority(PasscodeAlphabet alphabet = PasscodeAlphabet::Digits,
                             std::size_t length = kDefaultLength);

  Passcode generate();

  // On failure returns nullopt and, when reason is non-null, stores a
  // message naming the offending length or character.
  std::optional<Passcode> validate(const std::string& candidate, std::string* reason = nullptr) const;

  // 32 hex characters identifying one sender process in announcements.
  std::string make_session_token();

  PasscodeAlphabet alphabet() const { return alphabet_; }
  std::size_t length() const { return length_; }
  const std::string& characters() const { return characters_; }

private:
  PasscodeAlphabet alphabet_;
  std::size_t length_;
  std::string characters_;
  std::mt19937_64 rng_;
};
