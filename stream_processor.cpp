#include "stream_processor.hpp"
#include "error_code.hpp"
#include "record_transform.hpp"

#include <iostream>

namespace
{
    void record_matches(RunSummary &summary,
                        const RecordOutcome &outcome,
                        const PatternCatalog &catalog,
                        uint64_t record_index,
                        std::vector<RedactionEntry> *audit)
    {
        const auto &patterns = catalog.patterns();
        for (const auto &fr : outcome.redactions)
        {
            for (const auto &m : fr.matches)
            {
                const std::string &name = patterns[m.pattern_index].name();
                summary.matches_per_pattern[name]++;

                if (!audit)
                    continue;
                RedactionEntry e;
                e.record_index = record_index;
                e.record_kind = outcome.record.kind;
                e.field_index = static_cast<uint32_t>(fr.field_index);
                e.field_kind = outcome.record.fields[fr.field_index].kind;
                e.ordinal = m.ordinal;
                e.pattern = name;
                e.start = m.start;
                e.length = m.end - m.start;
                audit->push_back(std::move(e));
            }
        }
    }
}

RunSummary run_stream(RecordSource &source,
                      RecordSink &sink,
                      const PatternCatalog &catalog,
                      const StreamOptions &options)
{
    using clock = std::chrono::steady_clock;
    auto start_time = clock::now();

    RunSummary summary;
    for (const auto &p : catalog.patterns())
        summary.matches_per_pattern[p.name()] = 0;

    uint64_t record_index = 0;
    try
    {
        while (true)
        {
            if (options.cancel && options.cancel->load())
                throw RedactError(ErrorCode::ProcessingFailed,
                                  "Cancelled after " + std::to_string(record_index) + " records");

            std::optional<LogRecord> record = source.next();
            if (!record)
                break;

            if (record->kind == RecordKind::EmbeddedFile)
                summary.embedded_files++;

            RecordOutcome outcome = transform_record(std::move(*record), catalog, options.identify);
            if (outcome.changed)
            {
                summary.records_changed++;
                summary.total_matches += outcome.match_count;
                record_matches(summary, outcome, catalog, record_index, options.audit);

                if (options.verbose)
                {
                    std::cout << "[DEBUG] record#" << record_index
                              << " kind=" << record_kind_name(outcome.record.kind)
                              << " matches=" << outcome.match_count << "\n";
                }
            }

            sink.write(outcome.record);
            summary.records_processed++;
            record_index++;
        }
        sink.close();
    }
    catch (const RedactError &e)
    {
        if (e.code() == ErrorCode::ProcessingFailed)
            throw;
        throw RedactError(ErrorCode::ProcessingFailed,
                          "Processing failed at record#" + std::to_string(record_index) + ": " + e.what());
    }
    catch (const std::exception &e)
    {
        throw RedactError(ErrorCode::ProcessingFailed,
                          "Processing failed at record#" + std::to_string(record_index) + ": " + e.what());
    }

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start_time);
    return summary;
}
