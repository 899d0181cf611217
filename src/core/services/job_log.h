#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include "../types.h"

namespace hm {

// One row of the head table in a job sheet
struct JobLogRow {
    int headNumber = 0;
    std::string toolType; // "Straight", "Profile" or "[Empty]"
    std::string toolCode; // empty for an unassigned head
    std::optional<i64> rpm;
    std::optional<f64> passDepth;
};

// Machine setup snapshot written to the monthly job log
struct JobSheet {
    std::string profileName;
    f64 feedRate = 0.0;
    std::string materialSize;
    std::string productSize;
    std::vector<JobLogRow> rows;
};

namespace joblog {

// "job_edit_2024_03.log"
std::string fileNameFor(std::time_t when);

// Pipe table, rows sorted by head number
std::string formatHeadTable(std::vector<JobLogRow> rows);

// Complete entry: "<action> Configuration" banner, profile header, head table
std::string formatSheet(const JobSheet& sheet, const std::string& action, std::time_t when);

// Append the entry to dir/job_edit_YYYY_MM.log, creating dir if needed.
// Returns the file written, or nullopt on I/O failure.
std::optional<Path> write(const Path& dir, const JobSheet& sheet, const std::string& action,
                          std::time_t when = std::time(nullptr));

} // namespace joblog
} // namespace hm
