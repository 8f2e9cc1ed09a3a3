#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "rules/detection_profile.h"
#include "rules/layer_rule.h"

namespace LayerGuard {

constexpr const char* CORE_LAYER = "core";

/**
 * RuleRegistry
 *
 * Immutable catalogue of layer rules and detection profiles. Built once by
 * the caller (usually RuleRegistry::builtin()) and handed to the engine by
 * const reference; there is no process-wide instance.
 */
class RuleRegistry {
public:
    RuleRegistry(std::vector<LayerRule> layers, std::vector<DetectionProfile> profiles);

    /// The compiled-in rules: the `core` layer plus the full and simplified profiles
    [[nodiscard]] static RuleRegistry builtin();

    /// nullptr for an unknown layer name
    [[nodiscard]] const LayerRule* layerRuleFor(std::string_view name) const noexcept;

    /// nullptr for an unknown profile name
    [[nodiscard]] const DetectionProfile* profileFor(std::string_view name) const noexcept;

    /// Layer names in registration order
    [[nodiscard]] std::vector<std::string> layerNames() const;
    [[nodiscard]] std::vector<std::string> profileNames() const;

    [[nodiscard]] std::size_t layerCount() const noexcept { return layers_.size(); }

private:
    std::vector<LayerRule> layers_;
    std::vector<DetectionProfile> profiles_;
};

/// The `core` layer: pure domain logic, no UI, network or filesystem access
[[nodiscard]] LayerRule coreLayerRule();

} // namespace LayerGuard
