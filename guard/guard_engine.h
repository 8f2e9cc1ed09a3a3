#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/guard_config.h"
#include "report/validation_report.h"
#include "rules/rule_registry.h"

namespace Common {
class ThreadPool;
}

namespace LayerGuard {

/// Counters of the last run, for logging and the console summary
struct RunStats {
    uint32_t layers_checked{0};
    uint32_t files_scanned{0};
    uint64_t elapsed_ns{0};
};

/**
 * GuardEngine
 *
 * One complete validation: for every selected layer, locate its files and
 * run the import, manifest and pattern detectors, then merge everything
 * into a ValidationReport. With jobs > 1 the per-file scans run on a
 * worker pool; the report is identical to a sequential run.
 *
 * The registry must outlive the engine.
 */
class GuardEngine {
public:
    GuardEngine(const RuleRegistry& registry, GuardConfig config);

    GuardEngine(const GuardEngine&) = delete;
    GuardEngine& operator=(const GuardEngine&) = delete;

    [[nodiscard]] ValidationReport run() noexcept;

    [[nodiscard]] const RunStats& lastRunStats() const noexcept { return stats_; }
    [[nodiscard]] const GuardConfig& config() const noexcept { return config_; }

private:
    void checkLayer(const LayerRule& layer, uint32_t layer_index,
                    const DetectionProfile& profile,
                    Common::ThreadPool* pool,
                    std::vector<ViolationStream>* streams) noexcept;

    [[nodiscard]] std::vector<const LayerRule*> selectedLayers() const noexcept;

    const RuleRegistry& registry_;
    GuardConfig config_;
    RunStats stats_;
};

} // namespace LayerGuard
