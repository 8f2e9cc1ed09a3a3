#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace LayerGuard {

/// Closed set of violation categories. The string names are the `type`
/// field of the machine report and must never change.
enum class ViolationKind : uint8_t {
    FORBIDDEN_IMPORT = 0,
    FORBIDDEN_STD_IMPORT = 1,
    FORBIDDEN_DEPENDENCY = 2,
    FORBIDDEN_FEATURE = 3,
    POTENTIAL_VIOLATION = 4,
    MANIFEST_PARSE_ERROR = 5,
    FORBIDDEN_API_USAGE = 6,
    UNREADABLE_FILE = 7      // only produced under the Fail unreadable policy
};

constexpr std::size_t VIOLATION_KIND_COUNT = 8;

[[nodiscard]] const char* kindToString(ViolationKind kind) noexcept;

/// Inverse of kindToString; false for unknown names
[[nodiscard]] bool parseViolationKind(const char* name, ViolationKind* out) noexcept;

/// One detected boundary breach. Created once by a detector, never mutated.
class Violation {
public:
    Violation(std::string file, uint32_t line, ViolationKind kind, std::string detail);

    [[nodiscard]] const std::string& file() const noexcept { return file_; }

    /// 1-based line, 0 for file-level violations
    [[nodiscard]] uint32_t line() const noexcept { return line_; }

    [[nodiscard]] ViolationKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    /// "file:line [KIND] detail"
    [[nodiscard]] std::string toString() const;

    bool operator==(const Violation& other) const = default;

private:
    std::string file_;
    uint32_t line_;
    ViolationKind kind_;
    std::string detail_;
};

} // namespace LayerGuard
