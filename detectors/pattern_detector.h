#pragma once

#include <regex>
#include <string>
#include <vector>

#include "report/violation.h"
#include "rules/detection_profile.h"

namespace LayerGuard {

/**
 * PatternDetector
 *
 * Applies a layer's forbidden-API regexes to every line of a file,
 * import statement or not. Comments and string literals are not excluded.
 * Patterns are compiled once at construction; one that fails to compile
 * is logged and left out.
 */
class PatternDetector {
public:
    PatternDetector(std::string layer_name, UnreadablePolicy policy,
                    const std::vector<std::string>& regex_patterns) noexcept;

    [[nodiscard]] std::vector<Violation> scan(const std::string& file) const noexcept;

    [[nodiscard]] std::vector<Violation> scanLines(const std::string& file,
                                                   const std::vector<std::string>& lines) const noexcept;

    /// Patterns that compiled successfully
    [[nodiscard]] std::size_t patternCount() const noexcept { return patterns_.size(); }

private:
    struct CompiledPattern {
        std::string source;
        std::regex regex;
    };

    std::string layer_name_;
    UnreadablePolicy policy_;
    std::vector<CompiledPattern> patterns_;
};

} // namespace LayerGuard
