#include "rules/layer_rule.h"

#include <algorithm>

namespace LayerGuard {

ForbiddenDependency::ForbiddenDependency(bool wildcard, std::vector<std::string> features)
    : wildcard_(wildcard),
      features_(std::move(features)) {}

ForbiddenDependency ForbiddenDependency::wildcard() {
    return ForbiddenDependency(true, {});
}

ForbiddenDependency ForbiddenDependency::ofFeatures(std::vector<std::string> features) {
    // Keep first occurrence order, drop repeats
    std::vector<std::string> unique;
    unique.reserve(features.size());
    for (auto& feature : features) {
        if (std::find(unique.begin(), unique.end(), feature) == unique.end()) {
            unique.push_back(std::move(feature));
        }
    }
    return ForbiddenDependency(false, std::move(unique));
}

LayerRule::LayerRule(std::string name,
                     std::vector<std::string> file_patterns,
                     std::vector<std::string> forbidden_imports,
                     ForbiddenDependencyList forbidden_dependencies,
                     std::vector<std::string> forbidden_api_patterns)
    : name_(std::move(name)),
      file_patterns_(std::move(file_patterns)),
      forbidden_imports_(),
      forbidden_dependencies_(),
      forbidden_api_patterns_(std::move(forbidden_api_patterns)) {
    forbidden_imports_.reserve(forbidden_imports.size());
    for (auto& token : forbidden_imports) {
        if (token.empty()) continue;
        if (std::find(forbidden_imports_.begin(), forbidden_imports_.end(), token) ==
            forbidden_imports_.end()) {
            forbidden_imports_.push_back(std::move(token));
        }
    }

    // A package maps to one entry; the last registration wins
    for (auto& entry : forbidden_dependencies) {
        auto it = std::find_if(forbidden_dependencies_.begin(), forbidden_dependencies_.end(),
                               [&entry](const auto& existing) { return existing.first == entry.first; });
        if (it != forbidden_dependencies_.end()) {
            it->second = std::move(entry.second);
        } else {
            forbidden_dependencies_.push_back(std::move(entry));
        }
    }
}

const ForbiddenDependency* LayerRule::findForbiddenDependency(std::string_view package) const noexcept {
    for (const auto& [name, dependency] : forbidden_dependencies_) {
        if (name == package) {
            return &dependency;
        }
    }
    return nullptr;
}

} // namespace LayerGuard
