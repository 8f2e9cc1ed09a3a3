#include "detectors/pattern_detector.h"

#include "common/logging.h"
#include "detectors/source_reader.h"

namespace LayerGuard {

PatternDetector::PatternDetector(std::string layer_name, UnreadablePolicy policy,
                                 const std::vector<std::string>& regex_patterns) noexcept
    : layer_name_(std::move(layer_name)),
      policy_(policy),
      patterns_() {
    patterns_.reserve(regex_patterns.size());
    for (const auto& source : regex_patterns) {
        try {
            patterns_.push_back({source, std::regex(source, std::regex::ECMAScript | std::regex::optimize)});
        } catch (const std::regex_error& e) {
            LOG_ERROR("PatternDetector: invalid pattern '%s' ignored: %s", source.c_str(), e.what());
        }
    }
}

std::vector<Violation> PatternDetector::scanLines(const std::string& file,
                                                  const std::vector<std::string>& lines) const noexcept {
    std::vector<Violation> violations;
    uint32_t line_num = 0;

    for (const auto& line : lines) {
        ++line_num;
        for (const auto& pattern : patterns_) {
            bool matched = false;
            try {
                matched = std::regex_search(line, pattern.regex);
            } catch (const std::regex_error& e) {
                LOG_WARN("PatternDetector: '%s' failed on %s:%u: %s",
                         pattern.source.c_str(), file.c_str(), line_num, e.what());
                continue;
            }
            if (!matched) continue;

            std::string detail = "Layer '" + layer_name_ + "' uses forbidden API '" + pattern.source + "': ";
            detail.append(trimView(line));
            violations.emplace_back(file, line_num, ViolationKind::FORBIDDEN_API_USAGE, std::move(detail));
        }
    }

    return violations;
}

std::vector<Violation> PatternDetector::scan(const std::string& file) const noexcept {
    std::vector<std::string> lines;
    const ReadStatus status = readSourceLines(file, &lines);
    if (status != ReadStatus::Ok) {
        std::vector<Violation> violations;
        if (auto violation = unreadableViolation(file, status, policy_)) {
            violations.push_back(std::move(*violation));
        }
        return violations;
    }

    std::vector<Violation> violations = scanLines(file, lines);
    if (!violations.empty()) {
        LOG_INFO("PatternDetector: %zu violation(s) in %s", violations.size(), file.c_str());
    }
    return violations;
}

} // namespace LayerGuard
