#include "error_code.hpp"
#include "stream_processor.hpp"
#include "test_util.hpp"

#include <deque>
#include <stdexcept>

// In-memory decode side. Optionally fails when asked for record #fail_at.
class VectorSource : public RecordSource
{
public:
    explicit VectorSource(std::vector<LogRecord> records, long fail_at = -1)
        : records_(std::move(records)), fail_at_(fail_at) {}

    std::optional<LogRecord> next() override
    {
        if (fail_at_ >= 0 && static_cast<long>(pos_) == fail_at_)
            throw std::runtime_error("corrupt frame");
        if (pos_ >= records_.size())
            return std::nullopt;
        return records_[pos_++];
    }

    size_t pulled() const { return pos_; }

private:
    std::vector<LogRecord> records_;
    long fail_at_;
    size_t pos_ = 0;
};

class VectorSink : public RecordSink
{
public:
    void write(const LogRecord &record) override { written.push_back(record); }
    void close() override { closed = true; }

    std::vector<LogRecord> written;
    bool closed = false;
};

// Flips the cancel flag after the given number of writes.
class CancellingSink : public VectorSink
{
public:
    CancellingSink(std::atomic<bool> &flag, size_t after) : flag_(flag), after_(after) {}

    void write(const LogRecord &record) override
    {
        VectorSink::write(record);
        if (written.size() == after_)
            flag_.store(true);
    }

private:
    std::atomic<bool> &flag_;
    size_t after_;
};

static std::vector<LogRecord> build_log()
{
    return {
        make_record(RecordKind::BuildStarted, 1, {{FieldKind::Text, "Build started."}}),
        make_record(RecordKind::EnvironmentVariable, 2, {{FieldKind::Text, "NUGET_TOKEN=abc123"}}),
        make_record(RecordKind::TaskCommandLine, 3, {{FieldKind::Argument, "csc /nologo Program.cs"}}),
        make_record(RecordKind::EmbeddedFile, 4,
                    {{FieldKind::ArchiveEntryName, "nuget.config"},
                     {FieldKind::ArchiveEntryContent, "<add key=\"ClearTextPassword\" value=\"p4ss\" />"}}),
        make_record(RecordKind::Message, 5, {{FieldKind::Text, "password=one password=two"}}),
        make_record(RecordKind::BuildFinished, 6, {{FieldKind::Text, "Build succeeded."}}),
    };
}

int main()
{
    PatternCatalog catalog = PatternCatalog::build({"p4ss"}, true);

    // Every record reaches the sink once, in decode order.
    {
        auto log = build_log();
        VectorSource source(log);
        VectorSink sink;
        std::vector<RedactionEntry> audit;
        StreamOptions options;
        options.audit = &audit;

        RunSummary s = run_stream(source, sink, catalog, options);
        CHECK(sink.closed);
        CHECK(sink.written.size() == log.size());
        for (size_t i = 0; i < log.size() && i < sink.written.size(); ++i)
        {
            CHECK(sink.written[i].timestamp == log[i].timestamp);
            CHECK(sink.written[i].kind == log[i].kind);
        }

        CHECK(s.records_processed == 6);
        CHECK(s.records_changed == 3);
        CHECK(s.embedded_files == 1);
        CHECK(s.total_matches == 4);
        CHECK(s.matches_per_pattern["secret_assignment"] == 3);
        CHECK(s.matches_per_pattern["literal#1"] == 1);
        CHECK(s.matches_per_pattern.count("bearer_token") == 1);
        CHECK(audit.size() == 4);

        CHECK(*sink.written[1].fields[0].value == "NUGET_TOKEN=<REDACTED>");
        CHECK(*sink.written[4].fields[0].value == "password=<REDACTED> password=<REDACTED>");
        CHECK(!sink.written[0].dirty);
        CHECK(sink.written[0].fields[0].value.get() == log[0].fields[0].value.get());

        CHECK(audit[0].record_index == 1);
        CHECK(audit[0].record_kind == RecordKind::EnvironmentVariable);
        CHECK(audit[0].pattern == "secret_assignment");
        CHECK(audit[0].start == 12 && audit[0].length == 6);
        CHECK(audit[1].record_index == 3);
        CHECK(audit[1].field_kind == FieldKind::ArchiveEntryContent);
        CHECK(audit[1].pattern == "literal#1");
        CHECK(audit[3].ordinal == 1);
    }

    // Decode failures surface as ProcessingFailed with the cause.
    {
        VectorSource source(build_log(), 2);
        VectorSink sink;
        bool failed = false;
        try
        {
            run_stream(source, sink, catalog, StreamOptions{});
        }
        catch (const RedactError &e)
        {
            failed = e.code() == ErrorCode::ProcessingFailed &&
                     std::string(e.what()).find("corrupt frame") != std::string::npos;
        }
        CHECK(failed);
        CHECK(sink.written.size() == 2);
        CHECK(!sink.closed);
    }

    // Cancellation lands between records.
    {
        std::atomic<bool> cancel{false};
        VectorSource source(build_log());
        CancellingSink sink(cancel, 3);
        StreamOptions options;
        options.cancel = &cancel;
        bool failed = false;
        try
        {
            run_stream(source, sink, catalog, options);
        }
        catch (const RedactError &e)
        {
            failed = e.code() == ErrorCode::ProcessingFailed;
        }
        CHECK(failed);
        CHECK(sink.written.size() == 3);
        CHECK(source.pulled() == 3);
        CHECK(!sink.closed);
    }

    // Empty stream still closes the sink.
    {
        VectorSource source(std::vector<LogRecord>{});
        VectorSink sink;
        RunSummary s = run_stream(source, sink, catalog, StreamOptions{});
        CHECK(sink.closed);
        CHECK(s.records_processed == 0);
        CHECK(s.total_matches == 0);
    }

    return finish("test_stream_processor");
}
