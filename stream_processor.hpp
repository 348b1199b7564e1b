#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "pattern_catalog.hpp"
#include "record.hpp"
#include "record_stream.hpp"

// Aggregate of one pass. Mutated only while the pass runs.
struct RunSummary {
    size_t records_processed = 0;
    size_t records_changed = 0;
    size_t embedded_files = 0;
    size_t total_matches = 0;
    std::map<std::string, size_t> matches_per_pattern;
    std::chrono::milliseconds elapsed{0};
};

// One redacted span, as written to the audit database.
struct RedactionEntry {
    uint64_t record_index = 0;
    RecordKind record_kind = RecordKind::Message;
    uint32_t field_index = 0;
    FieldKind field_kind = FieldKind::Text;
    uint32_t ordinal = 0;
    std::string pattern;
    size_t start = 0;
    size_t length = 0;
};

struct StreamOptions {
    bool identify = false;
    bool verbose = false;

    // Checked between records; never mid-record.
    const std::atomic<bool> *cancel = nullptr;

    // When set, every match is appended here.
    std::vector<RedactionEntry> *audit = nullptr;
};

// Drive decode -> transform -> encode over the whole stream in order, then
// close the sink. Any decode, encode or cancellation failure is thrown as
// RedactError(ProcessingFailed) with the underlying cause in its message.
RunSummary run_stream(RecordSource &source,
                      RecordSink &sink,
                      const PatternCatalog &catalog,
                      const StreamOptions &options);
