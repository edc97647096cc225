#pragma once

#include <ostream>
#include <string>

#include <QString>

#include "common/models.hpp"

namespace tally {

// "March 2024"
QString monthLabel(const ReportModel &report);

void renderReportText(std::ostream &out, const ReportModel &report);
void renderReportJson(std::ostream &out, const ReportModel &report);

// <baseDir>/<Month-YYYY>/Time Sheet - <Month YYYY>.csv
QString csvExportPath(const QString &baseDir, const ReportModel &report);

// Writes the CSV time sheet and returns its path. Throws std::runtime_error
// when the directory or file cannot be written.
QString exportReportCsv(const QString &baseDir, const ReportModel &report);

// OSC 8 terminal hyperlink.
std::string osc8Link(const std::string &text, const std::string &url);

} // namespace tally
