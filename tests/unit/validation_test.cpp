#include "internal/core/validation.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace projmem::core;

void TestSanitizeStripsNulAndWhitespace() {
  const std::string raw = std::string("  use\0 sqlite \n", 15);
  assert(SanitizeText(raw, 100) == "use sqlite");
  assert(SanitizeText("   \t\n", 100).empty());
}

void TestSanitizeTruncatesWithMarker() {
  const std::string long_text(50, 'a');

  const auto out = SanitizeText(long_text, 30);
  assert(out.size() <= 30);
  assert(out.size() == 30);
  assert(out.substr(out.size() - kTruncationMarker.size()) == kTruncationMarker);

  // sanitizing again must not change anything
  assert(SanitizeText(out, 30) == out);
}

void TestSanitizeKeepsUtf8Sequences() {
  // "é" is two bytes; a cut in the middle must back off to the boundary
  std::string text;
  for (int i = 0; i < 20; ++i) text += "\xC3\xA9";

  const auto out  = SanitizeText(text, 20);
  const auto body = out.substr(0, out.size() - kTruncationMarker.size());
  assert(out.size() <= 20);
  assert(body.size() % 2 == 0);
}

void TestKeyValidation() {
  assert(ValidateKey("tech_stack"));
  assert(ValidateKey("api.v2-style"));
  assert(!ValidateKey(""));
  assert(!ValidateKey("has space"));
  assert(!ValidateKey("semi;colon"));
  assert(!ValidateKey(std::string(101, 'k')));
  assert(ValidateKey(std::string(100, 'k')));

  assert(RequireKey("key", "  padded  ") == "padded");

  bool threw = false;
  try {
    (void)RequireKey("key", "bad/key");
  } catch (const projmem::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestRequireTextRejectsEmpty() {
  bool threw = false;
  try {
    (void)RequireText("decision", " \0 ", 100);
  } catch (const projmem::util::ValidationError& e) {
    threw = std::string(e.what()).find("decision") != std::string::npos;
  }
  assert(threw);
}

void TestKeywordHandling() {
  assert(SanitizeKeyword(std::string(150, 'x')).size() == kMaxKeywordLength);
  assert(EscapeLike("50%_off\\") == "50\\%\\_off\\\\");
  assert(EscapeLike("plain") == "plain");
}

void TestPurgeConfirmation() {
  RequirePurgeConfirmation("CONFIRM_PURGE");

  bool threw = false;
  try {
    RequirePurgeConfirmation("confirm_purge");
  } catch (const projmem::util::PermissionDenied&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSanitizeStripsNulAndWhitespace();
  TestSanitizeTruncatesWithMarker();
  TestSanitizeKeepsUtf8Sequences();
  TestKeyValidation();
  TestRequireTextRejectsEmpty();
  TestKeywordHandling();
  TestPurgeConfirmation();

  std::cout << "project_memory_unit_validation: pass\n";
  return 0;
}
