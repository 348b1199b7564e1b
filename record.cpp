#include "record.hpp"

#include <iterator>

namespace
{
    const char *const kRecordKindNames[] = {
        "BuildStarted", "BuildFinished", "ProjectStarted", "ProjectFinished",
        "TargetStarted", "TargetFinished", "TaskStarted", "TaskFinished",
        "TaskCommandLine", "Message", "Warning", "Error",
        "PropertyAssignment", "EnvironmentVariable", "EmbeddedFile"};

    const char *const kFieldKindNames[] = {
        "Text", "Path", "Argument", "ArchiveEntryName", "ArchiveEntryContent", "Blob"};

    constexpr uint8_t kRecordKindCount = static_cast<uint8_t>(std::size(kRecordKindNames));
    constexpr uint8_t kFieldKindCount = static_cast<uint8_t>(std::size(kFieldKindNames));
}

SharedText make_text(std::string s)
{
    return std::make_shared<const std::string>(std::move(s));
}

bool is_text_field(FieldKind kind)
{
    return kind != FieldKind::Blob;
}

bool is_valid_record_kind(uint8_t v)
{
    return v >= 1 && v <= kRecordKindCount;
}

bool is_valid_field_kind(uint8_t v)
{
    return v < kFieldKindCount;
}

const char *record_kind_name(RecordKind kind)
{
    uint8_t v = static_cast<uint8_t>(kind);
    if (!is_valid_record_kind(v))
        return "Unknown";
    return kRecordKindNames[v - 1];
}

const char *field_kind_name(FieldKind kind)
{
    uint8_t v = static_cast<uint8_t>(kind);
    if (!is_valid_field_kind(v))
        return "Unknown";
    return kFieldKindNames[v];
}

bool parse_record_kind(const std::string &name, RecordKind &out)
{
    for (uint8_t i = 0; i < kRecordKindCount; ++i)
    {
        if (name == kRecordKindNames[i])
        {
            out = static_cast<RecordKind>(i + 1);
            return true;
        }
    }
    return false;
}

bool parse_field_kind(const std::string &name, FieldKind &out)
{
    for (uint8_t i = 0; i < kFieldKindCount; ++i)
    {
        if (name == kFieldKindNames[i])
        {
            out = static_cast<FieldKind>(i);
            return true;
        }
    }
    return false;
}
