#include "detectors/manifest_detector.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "common/logging.h"
#include "detectors/source_reader.h"
#include "manifest/toml_document.h"

namespace LayerGuard {

ManifestDetector::ManifestDetector(std::string layer_name, ManifestMode mode)
    : layer_name_(std::move(layer_name)),
      mode_(mode) {}

std::string ManifestDetector::parseError(std::string_view reason) const {
    std::string detail = "Failed to parse Cargo.toml: ";
    detail.append(reason);
    return detail;
}

std::string ManifestDetector::potentialDetail(const std::string& package,
                                              const ForbiddenDependency& forbidden) const {
    std::string detail = "Layer '" + layer_name_ + "' uses '" + package +
                         "' with default features - verify no forbidden features: [";
    const auto& features = forbidden.features();
    for (std::size_t i = 0; i < features.size(); ++i) {
        if (i > 0) detail += ", ";
        detail += features[i];
    }
    detail += ']';
    return detail;
}

void ManifestDetector::checkDependency(const std::string& manifest_path,
                                       const std::string& package,
                                       const TomlValue& entry,
                                       const ForbiddenDependency& forbidden,
                                       std::vector<Violation>* violations) const {
    if (forbidden.isWildcard()) {
        violations->emplace_back(manifest_path, 0, ViolationKind::FORBIDDEN_DEPENDENCY,
                                 "Layer '" + layer_name_ + "' cannot use forbidden dependency '" + package + "'");
        return;
    }

    // `name = "1.0"` carries neither a features list nor default-features
    const TomlValue* features = entry.isTable() ? entry.find("features") : nullptr;

    if (features && features->isArray()) {
        for (const auto& feature : forbidden.features()) {
            const auto& enabled = features->items();
            const bool present = std::any_of(enabled.begin(), enabled.end(), [&feature](const TomlValue& item) {
                return item.isString() && item.asString() == feature;
            });
            if (!present) continue;

            violations->emplace_back(manifest_path, 0, ViolationKind::FORBIDDEN_FEATURE,
                                     "Layer '" + layer_name_ + "' cannot use forbidden feature '" + feature +
                                     "' of '" + package + "'");
        }
        return;
    }

    if (features) {
        // A features key that is not an array cannot be verified
        LOG_WARN("ManifestDetector: 'features' of %s is not an array", package.c_str());
        violations->emplace_back(manifest_path, 0, ViolationKind::POTENTIAL_VIOLATION,
                                 potentialDetail(package, forbidden));
        return;
    }

    bool default_features = true;
    if (entry.isTable()) {
        const TomlValue* flag = entry.find("default-features");
        if (!flag) flag = entry.find("default_features");
        if (flag && flag->isBoolean()) {
            default_features = flag->asBoolean();
        }
    }

    if (default_features) {
        violations->emplace_back(manifest_path, 0, ViolationKind::POTENTIAL_VIOLATION,
                                 potentialDetail(package, forbidden));
    }
}

std::vector<Violation> ManifestDetector::scanStructured(const std::string& manifest_path,
                                                        std::string_view text,
                                                        const LayerRule& rule) const {
    std::vector<Violation> violations;

    const TomlParseResult parsed = parseToml(text);
    if (!parsed.ok) {
        LOG_ERROR("ManifestDetector: %s line %u: %s",
                  manifest_path.c_str(), parsed.error_line, parsed.error.c_str());
        violations.emplace_back(manifest_path, 0, ViolationKind::MANIFEST_PARSE_ERROR,
                                parseError("line " + std::to_string(parsed.error_line) + ": " + parsed.error));
        return violations;
    }

    const TomlValue* dependencies = parsed.root.find("dependencies");
    if (!dependencies) {
        return violations;
    }
    if (!dependencies->isTable()) {
        violations.emplace_back(manifest_path, 0, ViolationKind::MANIFEST_PARSE_ERROR,
                                parseError("'dependencies' is not a table"));
        return violations;
    }

    const auto& names = dependencies->keys();
    const auto& entries = dependencies->items();
    for (std::size_t i = 0; i < names.size(); ++i) {
        const TomlValue& entry = entries[i];

        // `alias = { package = "tokio", ... }` renames a dependency
        std::string package = names[i];
        if (entry.isTable()) {
            const TomlValue* renamed = entry.find("package");
            if (renamed && renamed->isString()) {
                package = renamed->asString();
            }
        }

        const ForbiddenDependency* forbidden = rule.findForbiddenDependency(package);
        if (!forbidden) continue;

        checkDependency(manifest_path, package, entry, *forbidden, &violations);
    }

    return violations;
}

std::vector<Violation> ManifestDetector::scanLineMatch(const std::string& manifest_path,
                                                       std::string_view text,
                                                       const LayerRule& rule) const {
    std::vector<Violation> violations;
    const std::vector<std::string> lines = splitLines(text);

    for (const auto& [package, forbidden] : rule.forbiddenDependencies()) {
        for (const auto& line : lines) {
            if (line.compare(0, package.size(), package) != 0) continue;

            const std::string_view rest = trimView(std::string_view(line).substr(package.size()));
            if (rest.empty() || rest.front() != '=') continue;

            if (forbidden.isWildcard()) {
                violations.emplace_back(manifest_path, 0, ViolationKind::FORBIDDEN_DEPENDENCY,
                                        "Layer '" + layer_name_ + "' cannot use forbidden dependency '" + package + "'");
            } else {
                violations.emplace_back(manifest_path, 0, ViolationKind::POTENTIAL_VIOLATION,
                                        potentialDetail(package, forbidden));
            }
            break;
        }
    }

    return violations;
}

std::vector<Violation> ManifestDetector::scanText(const std::string& manifest_path,
                                                  std::string_view text,
                                                  const LayerRule& rule) const noexcept {
    if (mode_ == ManifestMode::LineMatch) {
        return scanLineMatch(manifest_path, text, rule);
    }
    return scanStructured(manifest_path, text, rule);
}

std::vector<Violation> ManifestDetector::scan(const std::string& manifest_path,
                                              const LayerRule& rule) const noexcept {
    std::error_code ec;
    if (!std::filesystem::exists(manifest_path, ec) || ec) {
        LOG_INFO("ManifestDetector: no manifest at %s", manifest_path.c_str());
        return {};
    }

    std::string text;
    const ReadStatus status = readTextFile(manifest_path, &text);
    if (status != ReadStatus::Ok) {
        std::vector<Violation> violations;
        violations.emplace_back(manifest_path, 0, ViolationKind::MANIFEST_PARSE_ERROR,
                                parseError(std::string("manifest is ") + readStatusToString(status)));
        return violations;
    }

    std::vector<Violation> violations = scanText(manifest_path, text, rule);
    LOG_INFO("ManifestDetector: %zu violation(s) in %s", violations.size(), manifest_path.c_str());
    return violations;
}

} // namespace LayerGuard
