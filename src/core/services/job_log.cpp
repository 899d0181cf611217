#include "job_log.h"

#include <algorithm>
#include <cstdio>

#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace hm {
namespace joblog {

namespace {

constexpr const char* kBanner = "===========================================";

std::tm localTime(std::time_t when) {
    std::tm tm{};
    localtime_r(&when, &tm);
    return tm;
}

std::string formatTime(std::time_t when, const char* fmt) {
    std::tm tm = localTime(when);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string cell(std::string_view text, size_t width) {
    return " " + str::padRight(text, width) + " |";
}

} // namespace

std::string fileNameFor(std::time_t when) {
    return "job_edit_" + formatTime(when, "%Y_%m") + ".log";
}

std::string formatHeadTable(std::vector<JobLogRow> rows) {
    std::sort(rows.begin(), rows.end(), [](const JobLogRow& a, const JobLogRow& b) {
        return a.headNumber < b.headNumber;
    });

    std::string out;
    out += "| Head | Type    | Tool Code | RPM  | Pass Depth |\n";
    out += "|------|---------|-----------|------|------------|\n";

    for (const auto& row : rows) {
        std::string rpm = row.rpm ? std::to_string(*row.rpm) : "-";
        std::string depth = "-";
        if (row.passDepth) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f", *row.passDepth);
            depth = buf;
        }

        out += "|";
        out += cell(std::to_string(row.headNumber), 4);
        out += cell(row.toolType.empty() ? "[Empty]" : row.toolType, 7);
        out += cell(row.toolCode.empty() ? "-" : row.toolCode, 9);
        out += cell(rpm, 4);
        out += cell(depth, 10);
        out += "\n";
    }
    return out;
}

std::string formatSheet(const JobSheet& sheet, const std::string& action, std::time_t when) {
    std::string stamp = formatTime(when, "%Y-%m-%d %H:%M");

    std::string out;
    out += "\n";
    out += kBanner;
    out += "\n" + action + " Configuration - " + stamp + "\n";
    out += kBanner;
    out += "\n";
    out += "Date:           " + stamp + "\n";
    out += "Profile Name:   " + sheet.profileName + "\n";
    out += "Feed Rate:      " + str::formatDecimal(sheet.feedRate, 2) + " m/min\n";
    out += "Material Size:  " + sheet.materialSize + "\n";
    out += "Product Size:   " + sheet.productSize + "\n";
    out += "\n";
    out += "MILLING HEAD CONFIGURATION\n";
    out += std::string(49, '=') + "\n";
    out += formatHeadTable(sheet.rows);
    out += "\n" + std::string(50, '=') + "\n\n";
    return out;
}

std::optional<Path> write(const Path& dir, const JobSheet& sheet, const std::string& action,
                          std::time_t when) {
    if (!file::createDirectories(dir)) {
        log::errorf("JobLog", "Cannot create log directory %s", dir.string().c_str());
        return std::nullopt;
    }

    Path target = dir / fileNameFor(when);
    if (!file::appendText(target, formatSheet(sheet, action, when))) {
        log::errorf("JobLog", "Failed to write job log %s", target.string().c_str());
        return std::nullopt;
    }

    log::infof("JobLog", "%s configuration for '%s' logged to %s", action.c_str(),
               sheet.profileName.c_str(), target.filename().string().c_str());
    return target;
}

} // namespace joblog
} // namespace hm
