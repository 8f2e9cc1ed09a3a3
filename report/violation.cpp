#include "report/violation.h"

#include <cstring>
#include <utility>

namespace LayerGuard {

namespace {

constexpr const char* KIND_NAMES[VIOLATION_KIND_COUNT] = {
    "FORBIDDEN_IMPORT",
    "FORBIDDEN_STD_IMPORT",
    "FORBIDDEN_DEPENDENCY",
    "FORBIDDEN_FEATURE",
    "POTENTIAL_VIOLATION",
    "MANIFEST_PARSE_ERROR",
    "FORBIDDEN_API_USAGE",
    "UNREADABLE_FILE"
};

} // namespace

const char* kindToString(ViolationKind kind) noexcept {
    const auto idx = static_cast<std::size_t>(kind);
    return idx < VIOLATION_KIND_COUNT ? KIND_NAMES[idx] : "UNKNOWN";
}

bool parseViolationKind(const char* name, ViolationKind* out) noexcept {
    if (!name || !out) return false;
    for (std::size_t i = 0; i < VIOLATION_KIND_COUNT; ++i) {
        if (std::strcmp(name, KIND_NAMES[i]) == 0) {
            *out = static_cast<ViolationKind>(i);
            return true;
        }
    }
    return false;
}

Violation::Violation(std::string file, uint32_t line, ViolationKind kind, std::string detail)
    : file_(std::move(file)),
      line_(line),
      kind_(kind),
      detail_(std::move(detail)) {}

std::string Violation::toString() const {
    std::string out;
    out.reserve(file_.size() + detail_.size() + 32);
    out += file_;
    out += ':';
    out += std::to_string(line_);
    out += " [";
    out += kindToString(kind_);
    out += "] ";
    out += detail_;
    return out;
}

} // namespace LayerGuard
