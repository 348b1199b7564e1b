#pragma once

#include <optional>

#include "record.hpp"

// Pull side of the codec: a finite, non-restartable sequence of records.
class RecordSource
{
public:
    virtual ~RecordSource() = default;

    // Next record in container order, or nullopt once the stream is exhausted.
    virtual std::optional<LogRecord> next() = 0;
};

// Push side of the codec: accepts records in the order received.
class RecordSink
{
public:
    virtual ~RecordSink() = default;

    virtual void write(const LogRecord &record) = 0;
    virtual void close() = 0;
};

// Sink that drops everything (dry runs).
class NullSink : public RecordSink
{
public:
    void write(const LogRecord &) override {}
    void close() override {}
};
