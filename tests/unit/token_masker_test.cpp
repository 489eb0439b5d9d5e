#include "internal/logs/token_masker.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using tracelens::logs::IsWildcard;
using tracelens::logs::MaskToken;
using tracelens::logs::Tokenize;

void TestVariableTokensAreMasked() {
  assert(MaskToken("42") == "<*>");
  assert(MaskToken("-3.5") == "<*>");
  assert(MaskToken("250ms") == "<*>");
  assert(MaskToken("0xdeadbeef") == "<*>");
  assert(MaskToken("550e8400-e29b-41d4-a716-446655440000") == "<*>");
  assert(MaskToken("10.0.0.12:8080") == "<*>");
  assert(MaskToken("2024-05-01T12:30:00Z") == "<*>");
  assert(MaskToken("12:30:05") == "<*>");
  assert(MaskToken("user123") == "<*>");
}

void TestWordsAreKept() {
  assert(MaskToken("connection") == "connection");
  assert(MaskToken("timeout") == "timeout");
  assert(MaskToken("ERROR") == "ERROR");
  assert(MaskToken("<*>") == "<*>");
}

void TestPunctuationAndKeyValue() {
  assert(MaskToken("(42)") == "(<*>)");
  assert(MaskToken("id=9876,") == "id=<*>,");
  assert(MaskToken("status=failed") == "status=failed");
  assert(MaskToken("\"abc123\"") == "\"<*>\"");
}

void TestTokenizeSplitsOnWhitespace() {
  const auto tokens = Tokenize("  User 1234 logged in from 10.0.0.1\tafter 35ms ");
  const std::vector<std::string> expected = {"User", "<*>", "logged", "in", "from", "<*>", "after", "<*>"};
  assert(tokens == expected);
  assert(IsWildcard(tokens[1]));
  assert(!IsWildcard(tokens[0]));
  assert(Tokenize("").empty());
}

} // namespace

int main() {
  TestVariableTokensAreMasked();
  TestWordsAreKept();
  TestPunctuationAndKeyValue();
  TestTokenizeSplitsOnWhitespace();

  std::cout << "tracelens_unit_token_masker: pass\n";
  return 0;
}
