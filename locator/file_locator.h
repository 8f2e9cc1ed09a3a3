#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace LayerGuard {

/**
 * FileLocator
 *
 * Expands glob patterns into the set of existing, readable regular files
 * under a scan root. Supported syntax, per path segment: `*`, `?` and
 * `[...]` (fnmatch), plus `**` spanning zero or more directories.
 *
 * Returned paths are `root/relative` in generic form ("src/lib.rs" when
 * the root is "."). Directory symlinks are not followed.
 */
class FileLocator {
public:
    explicit FileLocator(std::filesystem::path root);

    /// Union of every pattern's matches, sorted and deduplicated
    [[nodiscard]] std::set<std::string> resolve(const std::vector<std::string>& patterns) const noexcept;

    [[nodiscard]] std::set<std::string> resolvePattern(std::string_view pattern) const noexcept;

    /// Segment-wise match of a relative path against a glob pattern
    [[nodiscard]] static bool matchGlob(std::string_view pattern, std::string_view path) noexcept;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    [[nodiscard]] std::string displayPath(const std::filesystem::path& relative) const;

    std::filesystem::path root_;
};

} // namespace LayerGuard
