#pragma once

#include <string>

#include "report/validation_report.h"

namespace LayerGuard {

/// Human-readable report: violations grouped by kind, then a remediation note
[[nodiscard]] std::string renderHuman(const ValidationReport& report);

/// Pretty-printed JSON array of {file, line, type, detail} records
[[nodiscard]] std::string renderMachine(const ValidationReport& report);

/// 0 when clean, 1 otherwise
[[nodiscard]] int exitStatus(const ValidationReport& report) noexcept;

/// Write renderMachine(report) to `path`, replacing any previous file
[[nodiscard]] bool writeMachineReport(const ValidationReport& report, const char* path) noexcept;

} // namespace LayerGuard
