#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace projmem::core {

/*
  Input validation.

  The only path by which caller-supplied text reaches storage. Everything
  here is pure; failures throw util::ValidationError.
*/

inline constexpr std::size_t      kMaxKeyLength      = 100;
inline constexpr std::size_t      kMaxKeywordLength  = 100;
inline constexpr std::string_view kTruncationMarker  = "... [truncated]";
inline constexpr std::string_view kPurgeConfirmToken = "CONFIRM_PURGE";

// Strips NUL bytes, trims whitespace and truncates to max_len bytes on a
// UTF-8 boundary, ending in kTruncationMarker. Result never exceeds max_len
// and sanitizing it again is a no-op.
std::string SanitizeText(std::string_view value, std::size_t max_len);

// [A-Za-z0-9_.-]{1,100}
bool ValidateKey(std::string_view key);

// Sanitizes and rejects an empty result.
std::string RequireText(std::string_view field, std::string_view value, std::size_t max_len);

// Sanitizes and checks ValidateKey().
std::string RequireKey(std::string_view field, std::string_view key);

// Sanitized search keyword cut to kMaxKeywordLength bytes (no marker).
std::string SanitizeKeyword(std::string_view keyword);

// Escapes '\', '%' and '_' so the keyword matches literally under ESCAPE '\'.
std::string EscapeLike(std::string_view keyword);

// Throws util::PermissionDenied unless token is exactly CONFIRM_PURGE.
void RequirePurgeConfirmation(std::string_view token);

} // namespace projmem::core
