#include "record_transform.hpp"

RecordOutcome transform_record(LogRecord record,
                               const PatternCatalog &catalog,
                               bool identify)
{
    RecordOutcome outcome;

    for (size_t i = 0; i < record.fields.size(); ++i)
    {
        RecordField &field = record.fields[i];
        if (!is_text_field(field.kind))
            continue;

        RedactionResult r = apply_redaction(field.value, catalog, identify);
        if (!r.changed)
            continue;

        field.value = std::move(r.text);
        outcome.match_count += r.matches.size();
        outcome.redactions.push_back({i, std::move(r.matches)});
        outcome.changed = true;
    }

    if (outcome.changed)
        record.dirty = true;
    outcome.record = std::move(record);
    return outcome;
}
