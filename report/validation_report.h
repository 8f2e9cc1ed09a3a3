#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "report/violation.h"

namespace LayerGuard {

/// Detector positions in the report order
enum class DetectorIndex : uint32_t {
    Import = 0,
    Manifest = 1,
    Pattern = 2
};

/// The violations one detector produced for one input, tagged with where
/// they belong in the merged report
struct ViolationStream {
    uint32_t layer_index{0};
    DetectorIndex detector{DetectorIndex::Import};
    uint32_t source_index{0};         // position of the file in the sorted file set
    std::vector<Violation> violations;
};

/**
 * ValidationReport
 *
 * Immutable result of one run: the ordered violation sequence (layer,
 * detector, file, then emission order).
 */
class ValidationReport {
public:
    ValidationReport() = default;
    explicit ValidationReport(std::vector<Violation> violations);

    [[nodiscard]] const std::vector<Violation>& violations() const noexcept { return violations_; }
    [[nodiscard]] bool isClean() const noexcept { return violations_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return violations_.size(); }
    [[nodiscard]] std::size_t countOf(ViolationKind kind) const noexcept;

    /// Kinds present in the report, in order of first appearance
    [[nodiscard]] std::vector<ViolationKind> kindsInFirstSeenOrder() const;

private:
    std::vector<Violation> violations_;
};

/// Merge detector outputs into one report. The result depends only on the
/// stream tags, never on the order the streams arrive in.
[[nodiscard]] ValidationReport aggregate(std::vector<ViolationStream> streams);

} // namespace LayerGuard
