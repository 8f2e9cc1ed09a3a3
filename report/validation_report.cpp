#include "report/validation_report.h"

#include <algorithm>
#include <iterator>
#include <tuple>

namespace LayerGuard {

ValidationReport::ValidationReport(std::vector<Violation> violations)
    : violations_(std::move(violations)) {}

std::size_t ValidationReport::countOf(ViolationKind kind) const noexcept {
    return static_cast<std::size_t>(std::count_if(violations_.begin(), violations_.end(),
                                                  [kind](const Violation& v) { return v.kind() == kind; }));
}

std::vector<ViolationKind> ValidationReport::kindsInFirstSeenOrder() const {
    std::vector<ViolationKind> kinds;
    bool seen[VIOLATION_KIND_COUNT] = {};
    for (const auto& violation : violations_) {
        const auto idx = static_cast<std::size_t>(violation.kind());
        if (idx < VIOLATION_KIND_COUNT && !seen[idx]) {
            seen[idx] = true;
            kinds.push_back(violation.kind());
        }
    }
    return kinds;
}

ValidationReport aggregate(std::vector<ViolationStream> streams) {
    auto key = [](const ViolationStream& s) {
        return std::make_tuple(s.layer_index, static_cast<uint32_t>(s.detector), s.source_index);
    };

    // Streams sharing a tag keep their arrival order
    std::stable_sort(streams.begin(), streams.end(),
                     [&key](const ViolationStream& a, const ViolationStream& b) { return key(a) < key(b); });

    std::size_t total = 0;
    for (const auto& stream : streams) {
        total += stream.violations.size();
    }

    std::vector<Violation> merged;
    merged.reserve(total);
    for (auto& stream : streams) {
        std::move(stream.violations.begin(), stream.violations.end(), std::back_inserter(merged));
    }
    return ValidationReport(std::move(merged));
}

} // namespace LayerGuard
