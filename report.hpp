#pragma once

#include <ostream>
#include <string>

#include "stream_processor.hpp"

struct ReportContext {
    std::string input_path;
    std::string output_path;
    bool dry_run = false;
    bool identify = false;
};

// Human readable summary.
void print_summary(std::ostream &os, const RunSummary &summary, const ReportContext &ctx);

// Machine readable summary (JSON). Returns false on I/O failure.
bool write_summary_json(const std::string &json_path, const RunSummary &summary, const ReportContext &ctx);
