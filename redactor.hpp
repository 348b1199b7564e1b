#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "error_code.hpp"
#include "file_system.hpp"
#include "stream_processor.hpp"

struct RedactOptions {
    std::string input_path;
    std::string output_file_name;            // empty: redact the input in place
    bool overwrite = false;
    bool disable_builtin_patterns = false;
    bool identify_replacements = false;
    std::vector<std::string> explicit_patterns;

    bool ignore_case = false;
    bool dry_run = false;
    bool verbose = false;
    std::string summary_json_path;
    std::string audit_db_path;
};

// Destination path for the options (the input itself when no output is given).
std::string resolve_output_path(const RedactOptions &options);

// Random sibling of the destination: "<output>.<16 hex>.tmp".
std::string make_temp_path(const std::string &output_path);

class Redactor
{
public:
    explicit Redactor(FileSystem &fs) : fs_(fs) {}

    // Validate, run one pass and commit the output. Never throws; every
    // failure is logged and mapped to its ErrorCode. The destination is only
    // modified when Success is returned.
    ErrorCode execute(const RedactOptions &options, const std::atomic<bool> *cancel = nullptr);

    // Summary of the last successful run.
    const std::optional<RunSummary> &last_summary() const { return last_summary_; }

private:
    ErrorCode run(const RedactOptions &options, const std::atomic<bool> *cancel);

    FileSystem &fs_;
    std::optional<RunSummary> last_summary_;
};
