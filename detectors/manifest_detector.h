#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "report/violation.h"
#include "rules/detection_profile.h"
#include "rules/layer_rule.h"

namespace LayerGuard {

class TomlValue;

/**
 * ManifestDetector
 *
 * Checks the `[dependencies]` table of a Cargo manifest against a layer's
 * forbidden packages and features. All violations are file-level (line 0)
 * in both modes.
 */
class ManifestDetector {
public:
    ManifestDetector(std::string layer_name, ManifestMode mode);

    /// A missing manifest yields no violations
    [[nodiscard]] std::vector<Violation> scan(const std::string& manifest_path,
                                              const LayerRule& rule) const noexcept;

    [[nodiscard]] std::vector<Violation> scanText(const std::string& manifest_path,
                                                  std::string_view text,
                                                  const LayerRule& rule) const noexcept;

private:
    [[nodiscard]] std::vector<Violation> scanStructured(const std::string& manifest_path,
                                                        std::string_view text,
                                                        const LayerRule& rule) const;

    [[nodiscard]] std::vector<Violation> scanLineMatch(const std::string& manifest_path,
                                                       std::string_view text,
                                                       const LayerRule& rule) const;

    void checkDependency(const std::string& manifest_path,
                         const std::string& package,
                         const TomlValue& entry,
                         const ForbiddenDependency& forbidden,
                         std::vector<Violation>* violations) const;

    [[nodiscard]] std::string parseError(std::string_view reason) const;
    [[nodiscard]] std::string potentialDetail(const std::string& package,
                                              const ForbiddenDependency& forbidden) const;

    std::string layer_name_;
    ManifestMode mode_;
};

} // namespace LayerGuard
