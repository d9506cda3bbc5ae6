#include "validation.hpp"

#include "internal/util/errors.hpp"

namespace projmem::core {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsKeyChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
}

// Largest cut <= pos that does not split a UTF-8 sequence.
std::size_t Utf8Boundary(const std::string& s, std::size_t pos) {
  while (pos > 0 && pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
    --pos;
  }
  return pos;
}

} // namespace

std::string SanitizeText(std::string_view value, std::size_t max_len) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c != '\0') out.push_back(c);
  }

  std::size_t begin = 0;
  std::size_t end   = out.size();
  while (begin < end && IsSpace(out[begin])) ++begin;
  while (end > begin && IsSpace(out[end - 1])) --end;
  out = out.substr(begin, end - begin);

  if (out.size() <= max_len) return out;

  if (max_len <= kTruncationMarker.size()) {
    out.resize(Utf8Boundary(out, max_len));
    return out;
  }

  out.resize(Utf8Boundary(out, max_len - kTruncationMarker.size()));
  out.append(kTruncationMarker);
  return out;
}

bool ValidateKey(std::string_view key) {
  if (key.empty() || key.size() > kMaxKeyLength) return false;
  for (char c : key) {
    if (!IsKeyChar(c)) return false;
  }
  return true;
}

std::string RequireText(std::string_view field, std::string_view value, std::size_t max_len) {
  auto out = SanitizeText(value, max_len);
  if (out.empty()) {
    throw util::ValidationError(std::string(field) + " is required");
  }
  return out;
}

std::string RequireKey(std::string_view field, std::string_view key) {
  // keys are never truncated: an over-long key is rejected instead
  auto out = SanitizeText(key, key.size());
  if (!ValidateKey(out)) {
    throw util::ValidationError("invalid " + std::string(field) + ": use 1-100 characters from [A-Za-z0-9_.-]");
  }
  return out;
}

std::string SanitizeKeyword(std::string_view keyword) {
  auto out = SanitizeText(keyword, keyword.size());
  if (out.size() > kMaxKeywordLength) out.resize(Utf8Boundary(out, kMaxKeywordLength));
  return out;
}

std::string EscapeLike(std::string_view keyword) {
  std::string out;
  out.reserve(keyword.size());
  for (char c : keyword) {
    if (c == '\\' || c == '%' || c == '_') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

void RequirePurgeConfirmation(std::string_view token) {
  if (token != kPurgeConfirmToken) {
    throw util::PermissionDenied("purge requires confirm=\"CONFIRM_PURGE\"");
  }
}

} // namespace projmem::core
