#pragma once

#include <vector>

#include "record.hpp"
#include "substitution.hpp"

struct FieldRedaction {
    size_t field_index = 0;
    std::vector<Match> matches;
};

struct RecordOutcome {
    LogRecord record;
    bool changed = false;
    size_t match_count = 0;
    std::vector<FieldRedaction> redactions;  // only fields that changed
};

// Redact every text-bearing field of one record independently; ordinals
// restart at zero for each field. Unchanged fields keep their original
// buffer. Blob fields are passed through untouched.
RecordOutcome transform_record(LogRecord record,
                               const PatternCatalog &catalog,
                               bool identify);
