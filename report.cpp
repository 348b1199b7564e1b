#include "report.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void print_summary(std::ostream &os, const RunSummary &summary, const ReportContext &ctx)
{
    if (ctx.dry_run)
        os << "🔍 Dry run over " << ctx.input_path << " (nothing written)\n";
    else
        os << "🔒 Redacted " << ctx.input_path << " -> " << ctx.output_path << "\n";

    os << "📦 Records: " << summary.records_processed
       << ", changed: " << summary.records_changed
       << ", embedded files: " << summary.embedded_files << "\n";
    os << "🧹 Redactions: " << summary.total_matches << "\n";
    for (const auto &kv : summary.matches_per_pattern)
    {
        if (kv.second == 0)
            continue;
        os << "    " << std::left << std::setw(20) << kv.first << kv.second << "\n";
    }
    os << "⏱️  " << summary.elapsed.count() << " ms\n";
}

bool write_summary_json(const std::string &json_path, const RunSummary &summary, const ReportContext &ctx)
{
    json j;
    j["input"] = ctx.input_path;
    j["output"] = ctx.dry_run ? json(nullptr) : json(ctx.output_path);
    j["dry_run"] = ctx.dry_run;
    j["identify_replacements"] = ctx.identify;
    j["records_processed"] = summary.records_processed;
    j["records_changed"] = summary.records_changed;
    j["embedded_files"] = summary.embedded_files;
    j["total_matches"] = summary.total_matches;
    j["matches_per_pattern"] = summary.matches_per_pattern;
    j["elapsed_ms"] = summary.elapsed.count();

    std::ofstream out(json_path);
    if (!out)
    {
        std::cerr << "❌ Failed to open JSON file for writing: " << json_path << "\n";
        return false;
    }

    out << j.dump(2); // pretty-print with 2-space indentation
    out.close();
    if (out.fail())
    {
        std::cerr << "❌ Failed writing JSON summary: " << json_path << "\n";
        return false;
    }
    return true;
}
