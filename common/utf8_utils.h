#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "common/macros.h"

namespace Common {

  /// Length of the well-formed UTF-8 sequence starting at bytes[i], or 0
  /// for a truncated, overlong, surrogate or out-of-range sequence
  inline auto utf8SequenceLength(std::string_view bytes, std::size_t i) noexcept -> std::size_t {
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t n = bytes.size();
    const unsigned char c = p[i];
    if (LIKELY(c < 0x80)) {
      return 1;
    }

    std::size_t extra = 0;
    uint32_t code_point = 0;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      code_point = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      code_point = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      code_point = c & 0x07;
    } else {
      return 0;
    }

    if (i + extra >= n) {
      return 0;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      if ((p[i + k] & 0xC0) != 0x80) {
        return 0;
      }
      code_point = (code_point << 6) | (p[i + k] & 0x3F);
    }

    if ((extra == 1 && code_point < 0x80) ||
        (extra == 2 && code_point < 0x800) ||
        (extra == 3 && code_point < 0x10000) ||
        (code_point >= 0xD800 && code_point <= 0xDFFF) ||
        code_point > 0x10FFFF) {
      return 0;
    }
    return extra + 1;
  }

  inline auto isValidUtf8(std::string_view bytes) noexcept -> bool {
    for (std::size_t i = 0; i < bytes.size();) {
      const std::size_t len = utf8SequenceLength(bytes, i);
      if (len == 0) {
        return false;
      }
      i += len;
    }
    return true;
  }

  /// Copy of `bytes` with every invalid byte replaced by U+FFFD
  inline auto sanitizeUtf8(std::string_view bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size());
    for (std::size_t i = 0; i < bytes.size();) {
      const std::size_t len = utf8SequenceLength(bytes, i);
      if (len == 0) {
        out += "\xEF\xBF\xBD";
        ++i;
        continue;
      }
      out.append(bytes.substr(i, len));
      i += len;
    }
    return out;
  }

} // namespace Common
