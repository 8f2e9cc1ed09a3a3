#include "rules/rule_registry.h"

#include "common/logging.h"

namespace LayerGuard {

// ========== Profiles ==========

const char* manifestModeToString(ManifestMode mode) noexcept {
    switch (mode) {
        case ManifestMode::Structured: return "structured";
        case ManifestMode::LineMatch:  return "line-match";
        default:                       return "unknown";
    }
}

const char* unreadablePolicyToString(UnreadablePolicy policy) noexcept {
    switch (policy) {
        case UnreadablePolicy::Skip: return "skip";
        case UnreadablePolicy::Fail: return "fail";
        default:                     return "unknown";
    }
}

DetectionProfile fullProfile() {
    DetectionProfile profile;
    profile.name = Profiles::FULL;
    profile.import_keywords = {"use "};
    profile.std_denylist = {"std::net", "std::fs", "std::path::Path"};
    profile.std_requires_keyword = true;
    profile.std_keywords = {"use ", "extern "};
    profile.manifest_mode = ManifestMode::Structured;
    profile.unreadable_policy = UnreadablePolicy::Skip;
    return profile;
}

DetectionProfile simplifiedProfile() {
    DetectionProfile profile;
    profile.name = Profiles::SIMPLIFIED;
    profile.import_keywords = {"use "};
    profile.std_denylist = {"std::net::", "std::fs::"};
    profile.std_requires_keyword = false;
    profile.std_keywords = {};
    profile.manifest_mode = ManifestMode::LineMatch;
    profile.unreadable_policy = UnreadablePolicy::Skip;
    return profile;
}

// ========== Built-in layers ==========

LayerRule coreLayerRule() {
    ForbiddenDependencyList dependencies;
    dependencies.emplace_back("tokio", ForbiddenDependency::ofFeatures({"net", "tcp", "udp"}));

    // Network clients/servers, GUI toolkits, terminal UI and filesystem helpers
    static constexpr const char* WILDCARD_PACKAGES[] = {
        "reqwest", "hyper", "actix-web", "warp", "axum", "surf", "ureq",
        "gtk", "egui", "tauri", "druid", "iced", "conrod",
        "cursive", "tui", "crossterm",
        "notify", "walkdir", "glob", "directories"
    };
    for (const char* package : WILDCARD_PACKAGES) {
        dependencies.emplace_back(package, ForbiddenDependency::wildcard());
    }

    return LayerRule(
        CORE_LAYER,
        {
            "src/core/**/*.rs",
            "src/lib.rs",
            "src/error.rs",
            "src/language_detector*.rs",
            "src/translator*.rs",
            "src/translation*.rs"
        },
        {"ui", "network", "filesystem", "web", "http", "tcp", "gui"},
        std::move(dependencies),
        {
            R"(tokio::net::)",
            R"(tokio::fs::)",
            R"(TcpListener)",
            R"(TcpStream)",
            R"(UdpSocket)"
        });
}

// ========== Registry ==========

RuleRegistry::RuleRegistry(std::vector<LayerRule> layers, std::vector<DetectionProfile> profiles)
    : layers_(std::move(layers)),
      profiles_(std::move(profiles)) {}

RuleRegistry RuleRegistry::builtin() {
    std::vector<LayerRule> layers;
    layers.push_back(coreLayerRule());

    std::vector<DetectionProfile> profiles;
    profiles.push_back(fullProfile());
    profiles.push_back(simplifiedProfile());

    return RuleRegistry(std::move(layers), std::move(profiles));
}

const LayerRule* RuleRegistry::layerRuleFor(std::string_view name) const noexcept {
    for (const auto& layer : layers_) {
        if (layer.name() == name) {
            return &layer;
        }
    }
    LOG_DEBUG("RuleRegistry: no layer named '%.*s'", static_cast<int>(name.size()), name.data());
    return nullptr;
}

const DetectionProfile* RuleRegistry::profileFor(std::string_view name) const noexcept {
    for (const auto& profile : profiles_) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

std::vector<std::string> RuleRegistry::layerNames() const {
    std::vector<std::string> names;
    names.reserve(layers_.size());
    for (const auto& layer : layers_) {
        names.push_back(layer.name());
    }
    return names;
}

std::vector<std::string> RuleRegistry::profileNames() const {
    std::vector<std::string> names;
    names.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        names.push_back(profile.name);
    }
    return names;
}

} // namespace LayerGuard
