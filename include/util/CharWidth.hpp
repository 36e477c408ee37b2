#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace inkwell::util {

// UTF-8 sequence length from the lead byte (1 for invalid leads)
int u8_len(unsigned char c);

// Decode one codepoint at s[i]. Sets len to the bytes consumed.
// Invalid or truncated sequences decode to U+FFFD with len 1.
char32_t u8_decode(std::string_view s, size_t i, int& len);

// Terminal columns for one codepoint: 0 for controls, combining marks and
// other zero-width characters, 2 for East Asian wide/fullwidth and emoji
// presentation, 1 otherwise.
[[nodiscard]] int codepoint_cols(char32_t cp);

// True for codepoints that attach to the preceding grapheme
[[nodiscard]] bool is_extender(char32_t cp);

[[nodiscard]] inline bool is_zwj(char32_t cp) { return cp == 0x200D; }

// Byte length of the grapheme cluster starting at s[i] (base codepoint plus
// combining marks, variation selectors and ZWJ-joined codepoints). Stops
// before an ESC byte so escape sequences are never folded into a cluster.
size_t grapheme_len(std::string_view s, size_t i, int& cols);

} // namespace inkwell::util
