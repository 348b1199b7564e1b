#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Field payloads are shared and immutable. An untouched field keeps pointing
// at the buffer the decoder produced.
using SharedText = std::shared_ptr<const std::string>;

SharedText make_text(std::string s);

// Build event classification
enum class RecordKind : uint8_t {
    BuildStarted = 1,
    BuildFinished = 2,
    ProjectStarted = 3,
    ProjectFinished = 4,
    TargetStarted = 5,
    TargetFinished = 6,
    TaskStarted = 7,
    TaskFinished = 8,
    TaskCommandLine = 9,
    Message = 10,
    Warning = 11,
    Error = 12,
    PropertyAssignment = 13,
    EnvironmentVariable = 14,
    EmbeddedFile = 15   // embedded-archive entry: name + content
};

enum class FieldKind : uint8_t {
    Text = 0,                  // message strings
    Path = 1,                  // file paths
    Argument = 2,              // command-line arguments
    ArchiveEntryName = 3,
    ArchiveEntryContent = 4,
    Blob = 5                   // opaque bytes, never scanned
};

struct RecordField {
    FieldKind kind = FieldKind::Text;
    SharedText value;
};

struct RawBlock;

// One decoded unit of the container.
struct LogRecord {
    RecordKind kind = RecordKind::Message;
    uint64_t timestamp = 0;
    std::vector<RecordField> fields;

    // Where the decoder found this record. Empty for records built in memory.
    std::shared_ptr<const RawBlock> origin;
    uint32_t origin_index = 0;

    // Set once any field has been replaced after decoding.
    bool dirty = false;
};

bool is_text_field(FieldKind kind);
bool is_valid_record_kind(uint8_t v);
bool is_valid_field_kind(uint8_t v);

const char *record_kind_name(RecordKind kind);
const char *field_kind_name(FieldKind kind);

// Reverse lookups for the JSON-lines interchange. Return false on unknown names.
bool parse_record_kind(const std::string &name, RecordKind &out);
bool parse_field_kind(const std::string &name, FieldKind &out);
