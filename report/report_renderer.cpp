#include "report/report_renderer.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "common/logging.h"
#include "common/utf8_utils.h"

namespace LayerGuard {

namespace {

constexpr const char* REMEDIATION_NOTE =
    "## Remediation\n"
    "Core modules must remain pure business logic without I/O dependencies.\n"
    "Move UI, network, and filesystem code to appropriate adapter layers.\n"
    "For more info, see: docs/architecture/layer-guidelines.md\n";

using ReportWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                            rapidjson::CrtAllocator, rapidjson::kWriteValidateEncodingFlag>;

// Paths need not be UTF-8; the report must be
bool writeJsonString(ReportWriter& writer, const std::string& value) {
    const std::string text = Common::isValidUtf8(value) ? value : Common::sanitizeUtf8(value);
    return writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
}

} // namespace

std::string renderHuman(const ValidationReport& report) {
    if (report.isClean()) {
        return "No architectural violations found. All layer boundaries are respected.\n";
    }

    std::string out = "Found " + std::to_string(report.size()) + " architectural violation(s):\n\n";

    for (const ViolationKind kind : report.kindsInFirstSeenOrder()) {
        out += "## ";
        out += kindToString(kind);
        out += " (" + std::to_string(report.countOf(kind)) + " violations)\n";
        for (const auto& violation : report.violations()) {
            if (violation.kind() != kind) continue;
            out += "  - ";
            out += violation.toString();
            out += '\n';
        }
        out += '\n';
    }

    out += REMEDIATION_NOTE;
    return out;
}

std::string renderMachine(const ValidationReport& report) {
    rapidjson::StringBuffer buffer;
    ReportWriter writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartArray();
    for (const auto& violation : report.violations()) {
        writer.StartObject();
        writer.Key("file");
        if (!writeJsonString(writer, violation.file())) {
            LOG_ERROR("Report: cannot encode path of %s", violation.file().c_str());
        }
        writer.Key("line");
        writer.Uint(violation.line());
        writer.Key("type");
        writer.String(kindToString(violation.kind()));
        writer.Key("detail");
        if (!writeJsonString(writer, violation.detail())) {
            LOG_ERROR("Report: cannot encode detail for %s", violation.file().c_str());
        }
        writer.EndObject();
    }
    writer.EndArray();

    std::string json(buffer.GetString(), buffer.GetSize());
    json += '\n';
    return json;
}

int exitStatus(const ValidationReport& report) noexcept {
    return report.isClean() ? 0 : 1;
}

bool writeMachineReport(const ValidationReport& report, const char* path) noexcept {
    if (!path || path[0] == '\0') {
        LOG_ERROR("No report path configured");
        return false;
    }

    const std::string json = renderMachine(report);

    int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR("Failed to create report file %s: %s", path, std::strerror(errno));
        return false;
    }

    std::size_t written = 0;
    while (written < json.size()) {
        const ssize_t n = write(fd, json.data() + written, json.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Failed to write report file %s: %s", path, std::strerror(errno));
            close(fd);
            return false;
        }
        written += static_cast<std::size_t>(n);
    }

    if (close(fd) != 0) {
        LOG_ERROR("Failed to close report file %s: %s", path, std::strerror(errno));
        return false;
    }

    LOG_INFO("Machine report written: %s (%zu violations)", path, report.size());
    return true;
}

} // namespace LayerGuard
