#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "report/violation.h"
#include "rules/detection_profile.h"

namespace LayerGuard {

enum class ReadStatus : uint8_t {
    Ok = 0,
    Unreadable = 1,   // open/stat/mmap failed
    NotUtf8 = 2
};

[[nodiscard]] const char* readStatusToString(ReadStatus status) noexcept;

/// Read a file and split it into physical lines (without the '\n').
/// A trailing newline does not produce an extra empty line.
[[nodiscard]] ReadStatus readSourceLines(const std::string& path, std::vector<std::string>* lines) noexcept;

/// Read a whole file as text; NotUtf8 when the bytes are not valid UTF-8
[[nodiscard]] ReadStatus readTextFile(const std::string& path, std::string* text) noexcept;

[[nodiscard]] std::vector<std::string> splitLines(std::string_view text);

[[nodiscard]] bool isValidUtf8(std::string_view bytes) noexcept;

/// Strip ASCII whitespace (space, \t, \r, \n, \f, \v) from both ends
[[nodiscard]] std::string_view trimView(std::string_view text) noexcept;

/// Apply the unreadable policy to a failed read: nothing under Skip,
/// one UNREADABLE_FILE violation at line 0 under Fail
[[nodiscard]] std::optional<Violation> unreadableViolation(const std::string& path,
                                                           ReadStatus status,
                                                           UnreadablePolicy policy);

} // namespace LayerGuard
