#include "passcode.hpp"
#include "test_runner_utils.hpp"

#include <cctype>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using codedrop::test::TestCase;
using codedrop::test::TestContext;

bool test_generate_then_validate(TestContext&) {
  for(auto alphabet : {PasscodeAlphabet::Digits, PasscodeAlphabet::Alphanumeric, PasscodeAlphabet::UpperAlphanumeric}) {
    for(std::size_t length : {std::size_t{4}, std::size_t{6}, std::size_t{32}}) {
      PasscodeAuthority authority(alphabet, length);
      for(int i = 0; i < 200; ++i) {
        auto code = authority.generate();
        if(code.size() != length) return false;
        for(char ch : code.str()) {
          if(authority.characters().find(ch) == std::string::npos) return false;
        }
        auto validated = authority.validate(code.str());
        if(!validated || *validated != code) return false;
      }
    }
  }
  return true;
}

bool test_generation_uses_whole_alphabet(TestContext&) {
  PasscodeAuthority authority(PasscodeAlphabet::Digits, 6);
  std::set<char> seen;
  for(int i = 0; i < 500; ++i) {
    for(char ch : authority.generate().str()) seen.insert(ch);
  }
  return seen.size() == 10;
}

bool test_rejects_wrong_length(TestContext&) {
  PasscodeAuthority authority;
  std::string reason;
  if(authority.validate("48291", &reason)) return false;
  if(reason.find("6") == std::string::npos) return false;
  if(authority.validate("4829134")) return false;
  return !authority.validate("");
}

bool test_rejects_foreign_characters(TestContext&) {
  PasscodeAuthority authority;
  std::string reason;
  if(authority.validate("48a913", &reason)) return false;
  if(reason.find("'a'") == std::string::npos) return false;
  return !authority.validate("48 913");
}

bool test_upper_alphanumeric_folds_case(TestContext&) {
  PasscodeAuthority authority(PasscodeAlphabet::UpperAlphanumeric, 6);
  auto code = authority.validate("ab12cZ");
  if(!code || code->str() != "AB12CZ") return false;
  for(int i = 0; i < 100; ++i) {
    for(char ch : authority.generate().str()) {
      if(std::islower(static_cast<unsigned char>(ch))) return false;
    }
  }
  return true;
}

bool test_alphanumeric_is_case_sensitive(TestContext&) {
  PasscodeAuthority authority(PasscodeAlphabet::Alphanumeric, 6);
  auto lower = authority.validate("abc123");
  auto upper = authority.validate("ABC123");
  if(!lower || !upper) return false;
  if(*lower == *upper) return false;
  return !authority.validate("abc12-");
}

bool test_matches_compares_raw_bytes(TestContext&) {
  PasscodeAuthority authority;
  auto code = authority.validate("482913");
  if(!code) return false;
  if(!code->matches("482913", 6)) return false;
  if(code->matches("482914", 6)) return false;
  return !code->matches("48291", 5);
}

bool test_length_bounds(TestContext&) {
  for(std::size_t bad : {std::size_t{0}, std::size_t{3}, std::size_t{33}}) {
    try {
      PasscodeAuthority authority(PasscodeAlphabet::Digits, bad);
      return false;
    } catch(const std::invalid_argument&) {
    }
  }
  return true;
}

bool test_session_tokens(TestContext&) {
  PasscodeAuthority authority;
  auto first = authority.make_session_token();
  auto second = authority.make_session_token();
  if(first.size() != 32 || first == second) return false;
  for(char ch : first) {
    if(!std::isxdigit(static_cast<unsigned char>(ch)) || std::isupper(static_cast<unsigned char>(ch))) {
      return false;
    }
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"generate_then_validate", test_generate_then_validate},
    {"generation_uses_whole_alphabet", test_generation_uses_whole_alphabet},
    {"rejects_wrong_length", test_rejects_wrong_length},
    {"rejects_foreign_characters", test_rejects_foreign_characters},
    {"upper_alphanumeric_folds_case", test_upper_alphanumeric_folds_case},
    {"alphanumeric_is_case_sensitive", test_alphanumeric_is_case_sensitive},
    {"matches_compares_raw_bytes", test_matches_compares_raw_bytes},
    {"length_bounds", test_length_bounds},
    {"session_tokens", test_session_tokens}
  };
  return codedrop::test::run_tests(argc, argv, "passcode", tests);
}
