#include "locator/file_locator.h"

#include <fnmatch.h>
#include <unistd.h>

#include <system_error>

#include "common/logging.h"

namespace LayerGuard {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> splitSegments(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        if (end > start) {
            std::string_view segment = path.substr(start, end - start);
            if (segment != ".") {
                segments.emplace_back(segment);
            }
        }
        start = end + 1;
    }
    return segments;
}

bool hasWildcard(std::string_view segment) noexcept {
    return segment.find_first_of("*?[") != std::string_view::npos;
}

bool matchSegments(const std::vector<std::string>& pattern, std::size_t pi,
                   const std::vector<std::string>& path, std::size_t si) noexcept {
    if (pi == pattern.size()) {
        return si == path.size();
    }

    if (pattern[pi] == "**") {
        for (std::size_t k = si; k <= path.size(); ++k) {
            if (matchSegments(pattern, pi + 1, path, k)) {
                return true;
            }
        }
        return false;
    }

    if (si == path.size()) {
        return false;
    }
    if (fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) != 0) {
        return false;
    }
    return matchSegments(pattern, pi + 1, path, si + 1);
}

bool isReadableRegularFile(const fs::path& path) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), R_OK) == 0;
}

} // namespace

FileLocator::FileLocator(fs::path root)
    : root_(std::move(root)) {
    if (root_.empty()) {
        root_ = ".";
    }
    root_ = root_.lexically_normal();
    // "crate/" normalizes with an empty final element; drop it
    if (!root_.has_filename() && root_ != root_.root_path()) {
        root_ = root_.parent_path();
    }
    if (root_.empty()) {
        root_ = ".";
    }
}

bool FileLocator::matchGlob(std::string_view pattern, std::string_view path) noexcept {
    return matchSegments(splitSegments(pattern), 0, splitSegments(path), 0);
}

std::string FileLocator::displayPath(const fs::path& relative) const {
    if (root_ == ".") {
        return relative.lexically_normal().generic_string();
    }
    return (root_ / relative).lexically_normal().generic_string();
}

std::set<std::string> FileLocator::resolvePattern(std::string_view pattern) const noexcept {
    std::set<std::string> matches;

    const std::vector<std::string> segments = splitSegments(pattern);
    if (segments.empty()) {
        return matches;
    }

    // Literal prefix becomes the base directory of the walk
    std::size_t first_wild = 0;
    while (first_wild < segments.size() && !hasWildcard(segments[first_wild])) {
        ++first_wild;
    }

    fs::path base_relative;
    for (std::size_t i = 0; i < first_wild; ++i) {
        base_relative /= segments[i];
    }

    if (first_wild == segments.size()) {
        if (isReadableRegularFile(root_ / base_relative)) {
            matches.insert(displayPath(base_relative));
        }
        return matches;
    }

    const fs::path base_dir = base_relative.empty() ? root_ : root_ / base_relative;
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        LOG_DEBUG("FileLocator: base directory %s missing for pattern %.*s",
                  base_dir.c_str(), static_cast<int>(pattern.size()), pattern.data());
        return matches;
    }

    const std::vector<std::string> remaining(segments.begin() + static_cast<std::ptrdiff_t>(first_wild),
                                             segments.end());
    bool recursive = false;
    for (const auto& segment : remaining) {
        if (segment == "**") {
            recursive = true;
            break;
        }
    }
    const int max_depth = static_cast<int>(remaining.size()) - 1;

    fs::recursive_directory_iterator it(base_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("FileLocator: cannot walk %s: %s", base_dir.c_str(), ec.message().c_str());
        return matches;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;

        if (!recursive && it.depth() >= max_depth) {
            it.disable_recursion_pending();
        }

        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && !entry_ec) {
            const fs::path relative = entry.path().lexically_relative(base_dir);
            const std::vector<std::string> path_segments = splitSegments(relative.generic_string());
            if (matchSegments(remaining, 0, path_segments, 0) &&
                ::access(entry.path().c_str(), R_OK) == 0) {
                matches.insert(displayPath(base_relative / relative));
            }
        }

        it.increment(ec);
        if (ec) {
            LOG_WARN("FileLocator: walk of %s stopped: %s", base_dir.c_str(), ec.message().c_str());
            break;
        }
    }

    return matches;
}

std::set<std::string> FileLocator::resolve(const std::vector<std::string>& patterns) const noexcept {
    std::set<std::string> files;
    for (const auto& pattern : patterns) {
        std::set<std::string> matches = resolvePattern(pattern);
        LOG_DEBUG("FileLocator: pattern %s matched %zu file(s)", pattern.c_str(), matches.size());
        files.merge(matches);
    }
    return files;
}

} // namespace LayerGuard
