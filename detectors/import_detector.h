#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "report/violation.h"
#include "rules/detection_profile.h"

namespace LayerGuard {

/**
 * ImportDetector
 *
 * Line scanner for `use` statements that reach into forbidden layers, and
 * for standard-library modules a layer must not touch. Textual: no Rust
 * parsing happens, each physical line is judged on its own.
 */
class ImportDetector {
public:
    ImportDetector(std::string layer_name, DetectionProfile profile);

    /// Read `file` and scan it. Unreadable files follow the profile's policy.
    [[nodiscard]] std::vector<Violation> scan(const std::string& file,
                                              const std::vector<std::string>& forbidden_imports) const noexcept;

    [[nodiscard]] std::vector<Violation> scanLines(const std::string& file,
                                                   const std::vector<std::string>& lines,
                                                   const std::vector<std::string>& forbidden_imports) const noexcept;

    /// True when `token` is a leading, interior or final `::` segment of
    /// the import path ("crate::ui::Widget" references "ui")
    [[nodiscard]] static bool referencesModule(std::string_view import_path, std::string_view token) noexcept;

    /// The path after the import keyword, without a trailing `;`.
    /// Empty when the trimmed line is not an import statement.
    [[nodiscard]] std::string_view importPath(std::string_view trimmed_line) const noexcept;

private:
    std::string layer_name_;
    DetectionProfile profile_;
};

} // namespace LayerGuard
