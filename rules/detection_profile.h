#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace LayerGuard {

/// How the manifest detector reads Cargo.toml
enum class ManifestMode : uint8_t {
    Structured = 0,   // parse the TOML and inspect each dependency entry
    LineMatch = 1     // `^name\s*=` over raw lines, no parse
};

/// What happens to a source file that cannot be read or decoded
enum class UnreadablePolicy : uint8_t {
    Skip = 0,
    Fail = 1          // emit one UNREADABLE_FILE violation at line 0
};

[[nodiscard]] const char* manifestModeToString(ManifestMode mode) noexcept;
[[nodiscard]] const char* unreadablePolicyToString(UnreadablePolicy policy) noexcept;

/// Named strictness configuration shared by every detector of a run
struct DetectionProfile {
    std::string name;
    std::vector<std::string> import_keywords;
    std::vector<std::string> std_denylist;
    bool std_requires_keyword{true};
    std::vector<std::string> std_keywords;
    ManifestMode manifest_mode{ManifestMode::Structured};
    UnreadablePolicy unreadable_policy{UnreadablePolicy::Skip};

    [[nodiscard]] DetectionProfile withUnreadablePolicy(UnreadablePolicy policy) const {
        DetectionProfile copy = *this;
        copy.unreadable_policy = policy;
        return copy;
    }
};

namespace Profiles {
    constexpr const char* FULL = "full";
    constexpr const char* SIMPLIFIED = "simplified";
}

[[nodiscard]] DetectionProfile fullProfile();
[[nodiscard]] DetectionProfile simplifiedProfile();

} // namespace LayerGuard
