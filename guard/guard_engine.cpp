#include "guard/guard_engine.h"

#include <future>
#include <memory>
#include <set>
#include <system_error>
#include <utility>

#include "common/logging.h"
#include "common/thread_utils.h"
#include "common/time_utils.h"
#include "detectors/import_detector.h"
#include "detectors/manifest_detector.h"
#include "detectors/pattern_detector.h"
#include "locator/file_locator.h"

namespace LayerGuard {

GuardEngine::GuardEngine(const RuleRegistry& registry, GuardConfig config)
    : registry_(registry),
      config_(std::move(config)),
      stats_() {}

std::vector<const LayerRule*> GuardEngine::selectedLayers() const noexcept {
    std::vector<const LayerRule*> layers;
    const std::vector<std::string> names = config_.layers.empty() ? registry_.layerNames() : config_.layers;
    for (const auto& name : names) {
        const LayerRule* layer = registry_.layerRuleFor(name);
        if (!layer) {
            LOG_ERROR("GuardEngine: unknown layer '%s' skipped", name.c_str());
            continue;
        }
        layers.push_back(layer);
    }
    return layers;
}

void GuardEngine::checkLayer(const LayerRule& layer, uint32_t layer_index,
                             const DetectionProfile& profile,
                             Common::ThreadPool* pool,
                             std::vector<ViolationStream>* streams) noexcept {
    const FileLocator locator(config_.root);
    const std::set<std::string> located = locator.resolve(layer.filePatterns());
    const std::vector<std::string> files(located.begin(), located.end());

    if (files.empty()) {
        LOG_WARN("GuardEngine: layer '%s' matched no files under %s",
                 layer.name().c_str(), config_.root.c_str());
    } else {
        LOG_INFO("GuardEngine: layer '%s' has %zu file(s)", layer.name().c_str(), files.size());
    }
    stats_.files_scanned += static_cast<uint32_t>(files.size());

    const ImportDetector import_detector(layer.name(), profile);
    const ManifestDetector manifest_detector(layer.name(), profile.manifest_mode);
    // Unreadable files are reported once, by the import pass
    const PatternDetector pattern_detector(layer.name(), UnreadablePolicy::Skip, layer.forbiddenApiPatterns());

    const std::string manifest_path = ConfigLoader::resolvedManifestPath(config_);

    auto makeStream = [layer_index](DetectorIndex detector, uint32_t source_index,
                                    std::vector<Violation> violations) {
        ViolationStream stream;
        stream.layer_index = layer_index;
        stream.detector = detector;
        stream.source_index = source_index;
        stream.violations = std::move(violations);
        return stream;
    };

    auto scanSequentially = [&] {
        for (uint32_t i = 0; i < files.size(); ++i) {
            streams->push_back(makeStream(DetectorIndex::Import, i,
                                          import_detector.scan(files[i], layer.forbiddenImports())));
        }
        streams->push_back(makeStream(DetectorIndex::Manifest, 0,
                                      manifest_detector.scan(manifest_path, layer)));
        for (uint32_t i = 0; i < files.size(); ++i) {
            streams->push_back(makeStream(DetectorIndex::Pattern, i, pattern_detector.scan(files[i])));
        }
    };

    if (!pool) {
        scanSequentially();
        return;
    }

    struct PendingScan {
        DetectorIndex detector;
        uint32_t source_index;
        std::future<std::vector<Violation>> result;
    };
    std::vector<PendingScan> pending;
    pending.reserve(files.size() * 2);

    try {
        for (uint32_t i = 0; i < files.size(); ++i) {
            const std::string& file = files[i];
            pending.push_back({DetectorIndex::Import, i, pool->enqueue([&import_detector, &layer, &file] {
                return import_detector.scan(file, layer.forbiddenImports());
            })});
            pending.push_back({DetectorIndex::Pattern, i, pool->enqueue([&pattern_detector, &file] {
                return pattern_detector.scan(file);
            })});
        }
    } catch (const std::exception& e) {
        LOG_ERROR("GuardEngine: worker pool rejected a task, scanning layer '%s' sequentially: %s",
                  layer.name().c_str(), e.what());
        for (auto& scan : pending) {
            scan.result.wait();
        }
        scanSequentially();
        return;
    }

    // The manifest is scanned once, on this thread, while the workers run
    streams->push_back(makeStream(DetectorIndex::Manifest, 0, manifest_detector.scan(manifest_path, layer)));

    // Every future is drained before the detectors go out of scope
    for (auto& scan : pending) {
        streams->push_back(makeStream(scan.detector, scan.source_index, scan.result.get()));
    }
}

ValidationReport GuardEngine::run() noexcept {
    stats_ = RunStats{};
    Common::StopWatch watch;

    const DetectionProfile* base_profile = registry_.profileFor(config_.profile);
    if (!base_profile) {
        LOG_ERROR("GuardEngine: unknown profile '%s', using '%s'", config_.profile.c_str(), Profiles::FULL);
        base_profile = registry_.profileFor(Profiles::FULL);
    }
    const DetectionProfile profile = base_profile
        ? base_profile->withUnreadablePolicy(config_.strict_read ? UnreadablePolicy::Fail : UnreadablePolicy::Skip)
        : fullProfile().withUnreadablePolicy(config_.strict_read ? UnreadablePolicy::Fail : UnreadablePolicy::Skip);

    LOG_INFO("GuardEngine: root=%s profile=%s manifest-mode=%s unreadable=%s jobs=%u",
             config_.root.c_str(), profile.name.c_str(),
             manifestModeToString(profile.manifest_mode),
             unreadablePolicyToString(profile.unreadable_policy),
             config_.jobs);

    std::unique_ptr<Common::ThreadPool> pool;
    if (config_.jobs > 1) {
        try {
            pool = std::make_unique<Common::ThreadPool>(config_.jobs);
        } catch (const std::system_error& e) {
            LOG_WARN("GuardEngine: cannot start %u workers, running sequentially: %s", config_.jobs, e.what());
        }
    }

    std::vector<ViolationStream> streams;
    const std::vector<const LayerRule*> layers = selectedLayers();
    for (uint32_t idx = 0; idx < layers.size(); ++idx) {
        checkLayer(*layers[idx], idx, profile, pool.get(), &streams);
        ++stats_.layers_checked;
    }

    ValidationReport report = aggregate(std::move(streams));
    stats_.elapsed_ns = watch.elapsedNanos();

    LOG_INFO("GuardEngine: %u layer(s), %u file(s), %zu violation(s) in %llu ms",
             stats_.layers_checked, stats_.files_scanned, report.size(),
             static_cast<unsigned long long>(stats_.elapsed_ns / 1'000'000ULL));
    return report;
}

} // namespace LayerGuard
