#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace LayerGuard {

class RuleRegistry;

/// Every setting of one run. Defaults scan `.` for the `core` layer with
/// the full profile.
struct GuardConfig {
    std::string root{"."};
    std::string manifest_path{"Cargo.toml"};        // relative paths resolve under root
    std::string report_path{"architecture_report.json"};
    std::vector<std::string> layers;                 // empty: every registered layer
    std::string profile{"full"};
    bool strict_read{false};
    uint32_t jobs{1};
    std::string log_file;    // empty disables file logging
    std::string log_level{"info"};
    bool quiet{false};
};

enum class CliAction : uint8_t {
    Run = 0,
    Help = 1,
    UsageError = 2
};

constexpr uint32_t MAX_JOBS = 256;

/**
 * ConfigLoader
 *
 * Layers the configuration sources: compiled-in defaults, then an optional
 * KEY=VALUE file (--config), then command-line flags.
 */
class ConfigLoader {
public:
    /// Apply a KEY=VALUE file; false when it cannot be opened or holds a bad value
    [[nodiscard]] static auto loadFile(const char* path, GuardConfig* config) noexcept -> bool;

    /// Apply one line of a config file. Comments and blank lines are accepted,
    /// unknown keys are warned about and ignored.
    [[nodiscard]] static auto parseLine(const char* line, GuardConfig* config, std::string* error) noexcept -> bool;

    [[nodiscard]] static auto parseCommandLine(int argc, const char* const argv[],
                                               GuardConfig* config, std::string* error) noexcept -> CliAction;

    [[nodiscard]] static auto validate(const GuardConfig& config, const RuleRegistry& registry,
                                       std::string* error) noexcept -> bool;

    /// Manifest path as the detectors should open it
    [[nodiscard]] static auto resolvedManifestPath(const GuardConfig& config) -> std::string;

private:
    [[nodiscard]] static auto parseBool(const std::string& text, bool* out) noexcept -> bool;
    [[nodiscard]] static auto parseJobs(const std::string& text, uint32_t* out) noexcept -> bool;
    [[nodiscard]] static auto splitList(const std::string& text) -> std::vector<std::string>;
};

} // namespace LayerGuard
