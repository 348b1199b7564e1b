#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pattern_catalog.hpp"
#include "record.hpp"

// Replacement written over every matched span.
constexpr const char *kRedactionMarker = "<REDACTED>";

// One located occurrence within a payload.
struct Match {
    size_t start = 0;          // [start, end) in the original payload
    size_t end = 0;
    size_t pattern_index = 0;  // into PatternCatalog::patterns()
    uint32_t ordinal = 0;      // discovery order within the payload, from 0
};

struct RedactionResult {
    SharedText text;
    std::vector<Match> matches;
    bool changed = false;
};

// "<REDACTED>" or, when identifying, "<REDACTED:ordinal>".
std::string make_marker(bool identify, uint32_t ordinal);

// Marker tokens already present in text. They are never matched again.
std::vector<Span> find_markers(const std::string &text);

// Scan one payload against the catalog. Overlapping candidates are resolved
// leftmost-longest (earliest start, then longest span, then catalog order).
// When nothing matches the returned text is the payload pointer itself.
RedactionResult apply_redaction(const SharedText &payload,
                                const PatternCatalog &catalog,
                                bool identify);
