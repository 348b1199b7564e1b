#include "redactor.hpp"
#include "audit_db.hpp"
#include "container.hpp"
#include "pattern_catalog.hpp"
#include "report.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <random>

std::string resolve_output_path(const RedactOptions &options)
{
    return options.output_file_name.empty() ? options.input_path : options.output_file_name;
}

std::string make_temp_path(const std::string &output_path)
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), ".%016llx.tmp", static_cast<unsigned long long>(dist(gen)));
    return output_path + suffix;
}

ErrorCode Redactor::execute(const RedactOptions &options, const std::atomic<bool> *cancel)
{
    last_summary_.reset();
    try
    {
        return run(options, cancel);
    }
    catch (const RedactError &e)
    {
        std::cerr << "❌ " << error_code_name(e.code()) << ": " << e.what() << "\n";
        return e.code();
    }
    catch (const ContainerError &e)
    {
        std::cerr << "❌ ProcessingFailed: " << e.what() << "\n";
        return ErrorCode::ProcessingFailed;
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        std::cerr << "❌ IOFailure: " << e.what() << "\n";
        return ErrorCode::IOFailure;
    }
    catch (const std::exception &e)
    {
        std::cerr << "❌ ProcessingFailed: " << e.what() << "\n";
        return ErrorCode::ProcessingFailed;
    }
}

ErrorCode Redactor::run(const RedactOptions &options, const std::atomic<bool> *cancel)
{
    // 1) options only, before touching the filesystem
    if (options.input_path.empty())
        throw RedactError(ErrorCode::InvalidOptions, "No input path given");

    PatternCatalog catalog = PatternCatalog::build(options.explicit_patterns,
                                                   !options.disable_builtin_patterns,
                                                   options.ignore_case);

    // 2) preconditions
    if (!fs_.exists(options.input_path) || fs_.is_directory(options.input_path))
        throw RedactError(ErrorCode::InputNotFound, "Input file not found: " + options.input_path);

    const std::string output_path = resolve_output_path(options);
    if (!options.dry_run && fs_.exists(output_path) && !options.overwrite)
        throw RedactError(ErrorCode::OutputAlreadyExists,
                          "Output file already exists: " + output_path + " (use --overwrite)");

    if (options.verbose)
    {
        std::cout << "[DEBUG] catalog: " << catalog.size() << " patterns (built-ins v"
                  << kBuiltinCatalogVersion << (options.disable_builtin_patterns ? " disabled" : "") << ")\n";
    }

    // 3) single pass
    std::vector<RedactionEntry> audit;
    StreamOptions stream_options;
    stream_options.identify = options.identify_replacements;
    stream_options.verbose = options.verbose;
    stream_options.cancel = cancel;
    stream_options.audit = options.audit_db_path.empty() ? nullptr : &audit;

    std::string temp_path;
    std::optional<TempFileScope> temp;
    if (!options.dry_run)
    {
        // Never write into, or later delete, a file this run did not create.
        temp_path = make_temp_path(output_path);
        if (fs_.exists(temp_path))
            throw RedactError(ErrorCode::IOFailure, "Temporary file already exists: " + temp_path);
        temp.emplace(fs_, temp_path);
    }
    RunSummary summary;
    {
        ContainerReader reader(options.input_path);
        if (options.dry_run)
        {
            NullSink sink;
            summary = run_stream(reader, sink, catalog, stream_options);
        }
        else
        {
            ContainerWriter writer(temp_path, reader.header());
            summary = run_stream(reader, writer, catalog, stream_options);

            if (options.verbose)
            {
                std::cout << "[DEBUG] blocks reused=" << writer.blocks_reused()
                          << " re-encoded=" << writer.blocks_encoded() << "\n";
            }
        }
    }

    // 4) reports go out before the destination is touched; the audit run is
    // staged in an open transaction and only committed once the output landed
    ReportContext ctx;
    ctx.input_path = options.input_path;
    ctx.output_path = output_path;
    ctx.dry_run = options.dry_run;
    ctx.identify = options.identify_replacements;

    if (!options.summary_json_path.empty() && !write_summary_json(options.summary_json_path, summary, ctx))
        throw RedactError(ErrorCode::IOFailure, "Cannot write summary: " + options.summary_json_path);

    AuditLog audit_log;
    if (!options.audit_db_path.empty() &&
        (!audit_log.open(options.audit_db_path) ||
         !audit_log.stage(options.input_path, options.dry_run ? "" : output_path, summary, audit)))
        throw RedactError(ErrorCode::IOFailure, "Cannot write audit database: " + options.audit_db_path);

    // 5) commit
    if (!options.dry_run)
    {
        fs_.replace_atomically(temp_path, output_path);
        temp->release();
    }

    if (audit_log.is_open() && !audit_log.commit())
        std::cerr << "⚠️  Output written but audit run not recorded: " << options.audit_db_path << "\n";

    print_summary(std::cout, summary, ctx);
    last_summary_ = summary;
    return ErrorCode::Success;
}
