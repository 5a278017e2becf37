#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pmlink::core {

// Deterministic ASCII-only normalization utilities.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.
//
// - ASCII lowercasing: A-Z -> a-z via explicit char math (no std::tolower)
// - ASCII punctuation and control characters act as word delimiters
// - UTF-8 punctuation, spaces and symbols (curly quotes, dashes, NBSP) act as
//   word delimiters too; other UTF-8 sequences are kept as word characters
// - No locale dependence, no undefined behavior

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// is_word_byte reports whether an ASCII byte is a letter or digit. Bytes >= 0x80
// also report true; fold_text decides on them per UTF-8 sequence.
inline bool is_word_byte(const char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         byte >= 0x80;
}

// utf8_sequence_length returns the length announced by a UTF-8 lead byte, or 0
// for a continuation byte or an invalid lead.
inline std::size_t utf8_sequence_length(const unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 2;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    return 4;
  }
  return 0;
}

// is_separator_code_point reports non-ASCII code points that fold to a space:
// Latin-1 punctuation and NBSP, the multiplication and division signs, General
// Punctuation (dashes, curly quotes, ellipsis, typographic spaces), currency
// signs, CJK punctuation, fullwidth ASCII punctuation and the BOM.
inline bool is_separator_code_point(const char32_t cp) {
  return (cp >= 0x80 && cp <= 0xBF) || cp == 0xD7 || cp == 0xF7 ||
         (cp >= 0x2000 && cp <= 0x206F) || (cp >= 0x20A0 && cp <= 0x20CF) ||
         (cp >= 0x3000 && cp <= 0x303F) || (cp >= 0xFE50 && cp <= 0xFE6F) ||
         (cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
         (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65) || cp == 0xFEFF;
}

// decode_utf8 decodes the sequence of the given length at the start of bytes.
// Returns false on a malformed continuation byte.
inline bool decode_utf8(const std::string_view bytes, const std::size_t length, char32_t& cp) {
  cp = static_cast<unsigned char>(bytes[0]) & (0xFFU >> (length + 1));
  for (std::size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<unsigned char>(bytes[i]);
    if ((byte & 0xC0) != 0x80) {
      return false;
    }
    cp = (cp << 6) | (byte & 0x3F);
  }
  return true;
}

// fold_text produces the comparison form of a text:
// - Lowercases ASCII letters
// - Replaces every non-word byte or UTF-8 separator with a single space
// - Collapses runs of spaces and trims both ends
// Two texts that differ only in case, punctuation or spacing fold to the same
// string, whether the punctuation is ASCII or typographic.
// Malformed UTF-8 bytes are kept verbatim as word characters.
inline std::string fold_text(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  bool pending_space = false;
  auto append = [&](const std::string_view bytes) {
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }
    result.append(bytes);
  };

  std::size_t i = 0;
  while (i < input.size()) {
    const char ch = input[i];
    const auto byte = static_cast<unsigned char>(ch);

    if (byte < 0x80) {
      if (!is_word_byte(ch)) {
        pending_space = !result.empty();
      } else if (ch >= 'A' && ch <= 'Z') {
        constexpr char kCaseOffset = 'a' - 'A';
        const char lower = static_cast<char>(ch + kCaseOffset);
        append(std::string_view(&lower, 1));
      } else {
        append(input.substr(i, 1));
      }
      ++i;
      continue;
    }

    std::size_t taken = 1;
    const std::size_t length = utf8_sequence_length(byte);
    char32_t cp = 0;
    if (length > 1 && i + length <= input.size() &&
        decode_utf8(input.substr(i, length), length, cp)) {
      if (is_separator_code_point(cp)) {
        pending_space = !result.empty();
        i += length;
        continue;
      }
      taken = length;
    }
    append(input.substr(i, taken));
    i += taken;
  }

  return result;
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace pmlink::core
