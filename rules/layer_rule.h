#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace LayerGuard {

/// What a layer forbids about one external package: the whole package
/// (wildcard) or only some of its features.
class ForbiddenDependency {
public:
    [[nodiscard]] static ForbiddenDependency wildcard();
    [[nodiscard]] static ForbiddenDependency ofFeatures(std::vector<std::string> features);

    [[nodiscard]] bool isWildcard() const noexcept { return wildcard_; }

    /// Forbidden feature names in declaration order; empty for a wildcard
    [[nodiscard]] const std::vector<std::string>& features() const noexcept { return features_; }

private:
    ForbiddenDependency(bool wildcard, std::vector<std::string> features);

    bool wildcard_;
    std::vector<std::string> features_;
};

using ForbiddenDependencyList = std::vector<std::pair<std::string, ForbiddenDependency>>;

/**
 * LayerRule
 *
 * One protected layer: which files belong to it and what those files and
 * the project manifest must not reference. Immutable after construction;
 * every detector reads it, the RuleRegistry owns it.
 */
class LayerRule {
public:
    LayerRule(std::string name,
              std::vector<std::string> file_patterns,
              std::vector<std::string> forbidden_imports,
              ForbiddenDependencyList forbidden_dependencies,
              std::vector<std::string> forbidden_api_patterns);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<std::string>& filePatterns() const noexcept { return file_patterns_; }
    [[nodiscard]] const std::vector<std::string>& forbiddenImports() const noexcept { return forbidden_imports_; }
    [[nodiscard]] const ForbiddenDependencyList& forbiddenDependencies() const noexcept { return forbidden_dependencies_; }
    [[nodiscard]] const std::vector<std::string>& forbiddenApiPatterns() const noexcept { return forbidden_api_patterns_; }

    /// nullptr when the package is not restricted for this layer
    [[nodiscard]] const ForbiddenDependency* findForbiddenDependency(std::string_view package) const noexcept;

private:
    std::string name_;
    std::vector<std::string> file_patterns_;
    std::vector<std::string> forbidden_imports_;
    ForbiddenDependencyList forbidden_dependencies_;
    std::vector<std::string> forbidden_api_patterns_;
};

} // namespace LayerGuard
