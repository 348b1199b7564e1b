#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "record.hpp"
#include "record_stream.hpp"

// On-disk layout (little-endian):
//   "BLGZ" | version | compression_level | flags
//   { record_count | raw_size | comp_size | zlib(raw) } ...
// raw block = record_count x { u8 kind | u64 timestamp | u32 field_count |
//                              { u8 field_kind | u32 len | bytes } ... }

constexpr char kContainerMagic[4] = {'B', 'L', 'G', 'Z'};
constexpr uint32_t kContainerVersion = 1;
constexpr size_t kDefaultRecordsPerBlock = 4096;

struct ContainerHeader {
    uint32_t version = kContainerVersion;
    uint32_t compression_level = 9;
    uint32_t flags = 0;
};

// One block exactly as it was read from disk.
struct RawBlock {
    uint32_t record_count = 0;
    uint32_t raw_size = 0;
    std::vector<char> comp;
};

// Malformed, truncated or unwritable container data.
class ContainerError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Write a uint32_t into a binary buffer
void write_u32(std::vector<char> &buf, uint32_t v);
void write_u64(std::vector<char> &buf, uint64_t v);

// Serialize one record into the raw (uncompressed) block layout.
void encode_record(const LogRecord &record, std::vector<char> &out);

// Parse one record at offset, advancing it. Throws ContainerError on truncation.
LogRecord decode_record(const std::vector<char> &blk, size_t &offset);

// zlib helpers; both throw ContainerError on failure.
void compress_blk_to_comp(const std::vector<char> &blk, std::vector<char> &comp, int level);
void decompress_comp_to_blk(const std::vector<char> &comp, std::vector<char> &blk, uint32_t orig_size);

class ContainerReader : public RecordSource
{
public:
    // Throws RedactError(IOFailure) if the file cannot be opened and
    // ContainerError if the header is not a supported BLGZ header.
    explicit ContainerReader(const std::string &path);

    const ContainerHeader &header() const { return header_; }
    size_t blocks_read() const { return blocks_read_; }

    std::optional<LogRecord> next() override;

private:
    bool load_next_block();

    std::string path_;
    std::ifstream in_;
    ContainerHeader header_;
    std::shared_ptr<const RawBlock> block_;
    std::vector<char> raw_;
    size_t offset_ = 0;
    uint32_t index_in_block_ = 0;
    size_t blocks_read_ = 0;
};

class ContainerWriter : public RecordSink
{
public:
    // Writes the header immediately. Throws RedactError(IOFailure) if the
    // file cannot be created.
    ContainerWriter(const std::string &path,
                    const ContainerHeader &header,
                    size_t records_per_block = kDefaultRecordsPerBlock);

    void write(const LogRecord &record) override;
    void close() override;

    size_t blocks_reused() const { return blocks_reused_; }
    size_t blocks_encoded() const { return blocks_encoded_; }

private:
    void flush_block();
    bool pending_is_pristine() const;
    void write_block(uint32_t record_count, uint32_t raw_size, const std::vector<char> &comp);

    std::string path_;
    std::ofstream out_;
    ContainerHeader header_;
    size_t records_per_block_;
    std::vector<LogRecord> pending_;
    size_t blocks_reused_ = 0;
    size_t blocks_encoded_ = 0;
    bool closed_ = false;
};
