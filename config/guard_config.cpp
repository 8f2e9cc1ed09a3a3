#include "config/guard_config.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include "common/logging.h"
#include "rules/rule_registry.h"

namespace LayerGuard {

namespace {

std::string trimCopy(const char* begin, const char* end) {
    while (begin < end && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
    return std::string(begin, static_cast<std::size_t>(end - begin));
}

} // namespace

// ========== Value parsing ==========

auto ConfigLoader::parseBool(const std::string& text, bool* out) noexcept -> bool {
    if (text == "1" || text == "true" || text == "TRUE" || text == "yes" || text == "on") {
        *out = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "no" || text == "off") {
        *out = false;
        return true;
    }
    return false;
}

auto ConfigLoader::parseJobs(const std::string& text, uint32_t* out) noexcept -> bool {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || value > MAX_JOBS) {
        return false;
    }
    *out = static_cast<uint32_t>(value);
    return true;
}

auto ConfigLoader::splitList(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> items;
    std::size_t start = 0;
    for (;;) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string item = trimCopy(text.c_str() + start, text.c_str() + comma);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        if (comma == text.size()) break;
        start = comma + 1;
    }
    return items;
}

// ========== Config file ==========

auto ConfigLoader::parseLine(const char* line, GuardConfig* config, std::string* error) noexcept -> bool {
    const char* end = line + std::strlen(line);
    const std::string trimmed = trimCopy(line, end);
    if (trimmed.empty() || trimmed[0] == '#') {
        return true;
    }

    const std::size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
        *error = "expected KEY=VALUE: " + trimmed;
        return false;
    }

    const std::string key = trimCopy(trimmed.c_str(), trimmed.c_str() + eq);
    const std::string value = trimCopy(trimmed.c_str() + eq + 1, trimmed.c_str() + trimmed.size());

    if (key == "ROOT") {
        config->root = value.empty() ? "." : value;
    } else if (key == "MANIFEST") {
        config->manifest_path = value;
    } else if (key == "REPORT") {
        config->report_path = value;
    } else if (key == "LAYERS") {
        config->layers = splitList(value);
    } else if (key == "PROFILE") {
        config->profile = value;
    } else if (key == "STRICT_READ") {
        if (!parseBool(value, &config->strict_read)) {
            *error = "STRICT_READ expects a boolean, got '" + value + "'";
            return false;
        }
    } else if (key == "JOBS") {
        if (!parseJobs(value, &config->jobs)) {
            *error = "JOBS expects a number up to " + std::to_string(MAX_JOBS) + ", got '" + value + "'";
            return false;
        }
    } else if (key == "LOG_FILE") {
        config->log_file = value;
    } else if (key == "LOG_LEVEL") {
        config->log_level = value;
    } else {
        // Logging is not up yet while the config loads
        fprintf(stderr, "Warning: unknown config key '%s' ignored\n", key.c_str());
    }
    return true;
}

auto ConfigLoader::loadFile(const char* path, GuardConfig* config) noexcept -> bool {
    FILE* fp = fopen(path, "r");
    if (!fp) {
        fprintf(stderr, "Failed to open config file: %s: %s\n", path, strerror(errno));
        return false;
    }

    char line[1024];
    uint32_t line_num = 0;
    bool ok = true;
    while (fgets(line, sizeof(line), fp)) {
        ++line_num;
        std::string error;
        if (!parseLine(line, config, &error)) {
            fprintf(stderr, "%s:%u: %s\n", path, line_num, error.c_str());
            ok = false;
            break;
        }
    }

    fclose(fp);
    return ok;
}

// ========== Command line ==========

auto ConfigLoader::parseCommandLine(int argc, const char* const argv[],
                                    GuardConfig* config, std::string* error) noexcept -> CliAction {
    // The config file sits below the flags in precedence, so load it first
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            return CliAction::Help;
        }
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                *error = "--config requires a value";
                return CliAction::UsageError;
            }
            if (!loadFile(argv[i + 1], config)) {
                *error = std::string("invalid config file: ") + argv[i + 1];
                return CliAction::UsageError;
            }
            ++i;
        }
    }

    std::vector<std::string> cli_layers;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        const bool takes_value =
            std::strcmp(arg, "--root") == 0 || std::strcmp(arg, "--manifest") == 0 ||
            std::strcmp(arg, "--report") == 0 || std::strcmp(arg, "--layer") == 0 ||
            std::strcmp(arg, "--profile") == 0 || std::strcmp(arg, "--jobs") == 0 ||
            std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "--log") == 0 ||
            std::strcmp(arg, "--log-level") == 0;

        if (takes_value && i + 1 >= argc) {
            *error = std::string(arg) + " requires a value";
            return CliAction::UsageError;
        }

        if (std::strcmp(arg, "--root") == 0) {
            config->root = argv[++i];
        }
        else if (std::strcmp(arg, "--manifest") == 0) {
            config->manifest_path = argv[++i];
        }
        else if (std::strcmp(arg, "--report") == 0) {
            config->report_path = argv[++i];
        }
        else if (std::strcmp(arg, "--layer") == 0) {
            cli_layers.emplace_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--profile") == 0) {
            config->profile = argv[++i];
        }
        else if (std::strcmp(arg, "--jobs") == 0) {
            const std::string value = argv[++i];
            if (!parseJobs(value, &config->jobs)) {
                *error = "--jobs expects a number up to " + std::to_string(MAX_JOBS) + ", got '" + value + "'";
                return CliAction::UsageError;
            }
        }
        else if (std::strcmp(arg, "--config") == 0) {
            ++i;  // applied above
        }
        else if (std::strcmp(arg, "--log") == 0) {
            config->log_file = argv[++i];
        }
        else if (std::strcmp(arg, "--log-level") == 0) {
            config->log_level = argv[++i];
        }
        else if (std::strcmp(arg, "--strict-read") == 0) {
            config->strict_read = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0 || std::strcmp(arg, "-q") == 0) {
            config->quiet = true;
        }
        else {
            *error = std::string("unknown option: ") + arg;
            return CliAction::UsageError;
        }
    }

    if (!cli_layers.empty()) {
        config->layers = std::move(cli_layers);
    }
    return CliAction::Run;
}

// ========== Validation ==========

auto ConfigLoader::validate(const GuardConfig& config, const RuleRegistry& registry,
                            std::string* error) noexcept -> bool {
    if (!registry.profileFor(config.profile)) {
        *error = "unknown profile '" + config.profile + "', expected one of: ";
        const std::vector<std::string> names = registry.profileNames();
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (i > 0) *error += ", ";
            *error += names[i];
        }
        return false;
    }
    if (config.jobs == 0 || config.jobs > MAX_JOBS) {
        *error = "jobs must be between 1 and " + std::to_string(MAX_JOBS);
        return false;
    }
    if (config.report_path.empty()) {
        *error = "report path must not be empty";
        return false;
    }
    if (config.root.empty()) {
        *error = "root directory must not be empty";
        return false;
    }
    for (const auto& layer : config.layers) {
        if (!registry.layerRuleFor(layer)) {
            *error = "unknown layer '" + layer + "'";
            return false;
        }
    }
    Common::LogLevel level;
    if (!Common::parseLogLevel(config.log_level.c_str(), &level)) {
        *error = "unknown log level '" + config.log_level + "'";
        return false;
    }
    return true;
}

auto ConfigLoader::resolvedManifestPath(const GuardConfig& config) -> std::string {
    const std::filesystem::path manifest(config.manifest_path);
    if (manifest.is_absolute() || config.root.empty() || config.root == ".") {
        return manifest.lexically_normal().generic_string();
    }
    return (std::filesystem::path(config.root) / manifest).lexically_normal().generic_string();
}

} // namespace LayerGuard
