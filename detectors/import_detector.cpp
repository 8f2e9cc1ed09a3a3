#include "detectors/import_detector.h"

#include "common/logging.h"
#include "detectors/source_reader.h"

namespace LayerGuard {

ImportDetector::ImportDetector(std::string layer_name, DetectionProfile profile)
    : layer_name_(std::move(layer_name)),
      profile_(std::move(profile)) {}

std::string_view ImportDetector::importPath(std::string_view trimmed_line) const noexcept {
    for (const auto& keyword : profile_.import_keywords) {
        if (trimmed_line.substr(0, keyword.size()) != keyword) {
            continue;
        }
        std::string_view path = trimView(trimmed_line.substr(keyword.size()));
        while (!path.empty() && path.back() == ';') {
            path.remove_suffix(1);
            path = trimView(path);
        }
        return path;
    }
    return {};
}

bool ImportDetector::referencesModule(std::string_view import_path, std::string_view token) noexcept {
    if (import_path.empty() || token.empty()) {
        return false;
    }

    // Leading segment: "token::..." or the bare "token"
    if (import_path.substr(0, token.size()) == token) {
        if (import_path.size() == token.size() ||
            import_path.substr(token.size(), 2) == "::") {
            return true;
        }
    }

    std::string needle = "::";
    needle += token;

    std::size_t pos = import_path.find(needle);
    while (pos != std::string_view::npos) {
        const std::size_t after = pos + needle.size();
        if (after == import_path.size() || import_path.substr(after, 2) == "::") {
            return true;
        }
        pos = import_path.find(needle, pos + 1);
    }
    return false;
}

std::vector<Violation> ImportDetector::scanLines(const std::string& file,
                                                 const std::vector<std::string>& lines,
                                                 const std::vector<std::string>& forbidden_imports) const noexcept {
    std::vector<Violation> violations;
    uint32_t line_num = 0;

    for (const auto& raw : lines) {
        ++line_num;
        const std::string_view line = trimView(raw);
        if (line.empty()) continue;

        const std::string_view path = importPath(line);
        if (!path.empty()) {
            for (const auto& token : forbidden_imports) {
                if (!referencesModule(path, token)) continue;

                std::string detail = "Layer '" + layer_name_ + "' imports forbidden module '" + token + "': ";
                detail.append(line);
                violations.emplace_back(file, line_num, ViolationKind::FORBIDDEN_IMPORT, std::move(detail));
            }
        }

        bool keyword_present = !profile_.std_requires_keyword;
        if (!keyword_present) {
            for (const auto& keyword : profile_.std_keywords) {
                if (line.find(keyword) != std::string_view::npos) {
                    keyword_present = true;
                    break;
                }
            }
        }
        if (!keyword_present) continue;

        for (const auto& prefix : profile_.std_denylist) {
            if (line.find(prefix) == std::string_view::npos) continue;

            std::string detail = "Layer '" + layer_name_ + "' uses forbidden std import '" + prefix + "': ";
            detail.append(line);
            violations.emplace_back(file, line_num, ViolationKind::FORBIDDEN_STD_IMPORT, std::move(detail));
        }
    }

    return violations;
}

std::vector<Violation> ImportDetector::scan(const std::string& file,
                                            const std::vector<std::string>& forbidden_imports) const noexcept {
    std::vector<std::string> lines;
    const ReadStatus status = readSourceLines(file, &lines);
    if (status != ReadStatus::Ok) {
        std::vector<Violation> violations;
        if (auto violation = unreadableViolation(file, status, profile_.unreadable_policy)) {
            violations.push_back(std::move(*violation));
        }
        return violations;
    }

    std::vector<Violation> violations = scanLines(file, lines, forbidden_imports);
    if (!violations.empty()) {
        LOG_INFO("ImportDetector: %zu violation(s) in %s", violations.size(), file.c_str());
    }
    return violations;
}

} // namespace LayerGuard
