#include "container.hpp"
#include "error_code.hpp"

#include <cstring>
#include <zlib.h>

namespace
{
    // Upper bound on a single inflated block; anything larger is treated as corruption.
    constexpr uint32_t kMaxRawBlockSize = 256u * 1024 * 1024;

    void write_u8(std::vector<char> &buf, uint8_t v)
    {
        buf.push_back(static_cast<char>(v));
    }

    bool has_bytes(const std::vector<char> &buf, size_t offset, size_t n)
    {
        return offset <= buf.size() && buf.size() - offset >= n;
    }

    uint32_t read_u32_mem(const char *&p)
    {
        uint32_t v;
        std::memcpy(&v, p, 4);
        p += 4;
        return v;
    }

    uint32_t read_u32(const std::vector<char> &buf, size_t &offset)
    {
        uint32_t v;
        std::memcpy(&v, buf.data() + offset, sizeof(uint32_t));
        offset += 4;
        return v;
    }

    uint64_t read_u64(const std::vector<char> &buf, size_t &offset)
    {
        uint64_t v;
        std::memcpy(&v, buf.data() + offset, sizeof(uint64_t));
        offset += 8;
        return v;
    }
}

void write_u32(std::vector<char> &buf, uint32_t v)
{
    char tmp[4];
    std::memcpy(tmp, &v, 4);
    buf.insert(buf.end(), tmp, tmp + 4);
}

void write_u64(std::vector<char> &buf, uint64_t v)
{
    char tmp[8];
    std::memcpy(tmp, &v, 8);
    buf.insert(buf.end(), tmp, tmp + 8);
}

void encode_record(const LogRecord &record, std::vector<char> &out)
{
    write_u8(out, static_cast<uint8_t>(record.kind));
    write_u64(out, record.timestamp);
    write_u32(out, static_cast<uint32_t>(record.fields.size()));
    for (const auto &f : record.fields)
    {
        write_u8(out, static_cast<uint8_t>(f.kind));
        if (!f.value)
        {
            write_u32(out, 0);
            continue;
        }
        write_u32(out, static_cast<uint32_t>(f.value->size()));
        out.insert(out.end(), f.value->begin(), f.value->end());
    }
}

LogRecord decode_record(const std::vector<char> &blk, size_t &offset)
{
    // kind + timestamp + field_count
    if (!has_bytes(blk, offset, 13))
        throw ContainerError("Block data truncated reading record header at offset " + std::to_string(offset));

    LogRecord r;
    uint8_t kind = static_cast<uint8_t>(blk[offset++]);
    if (!is_valid_record_kind(kind))
        throw ContainerError("Unknown record kind " + std::to_string(kind) + " at offset " + std::to_string(offset - 1));
    r.kind = static_cast<RecordKind>(kind);
    r.timestamp = read_u64(blk, offset);
    uint32_t field_count = read_u32(blk, offset);

    // every field needs at least its kind byte and length
    if (static_cast<uint64_t>(field_count) * 5 > blk.size() - offset)
        throw ContainerError("Block data truncated reading " + std::to_string(field_count) + " fields");

    r.fields.reserve(field_count);
    for (uint32_t i = 0; i < field_count; ++i)
    {
        if (!has_bytes(blk, offset, 5))
            throw ContainerError("Block data truncated reading field#" + std::to_string(i));
        uint8_t fkind = static_cast<uint8_t>(blk[offset++]);
        if (!is_valid_field_kind(fkind))
            throw ContainerError("Unknown field kind " + std::to_string(fkind) + " in field#" + std::to_string(i));
        uint32_t len = read_u32(blk, offset);
        if (!has_bytes(blk, offset, len))
            throw ContainerError("Block data truncated reading value of field#" + std::to_string(i)
                                 + " (len=" + std::to_string(len) + ")");

        RecordField f;
        f.kind = static_cast<FieldKind>(fkind);
        f.value = make_text(std::string(blk.data() + offset, len));
        offset += len;
        r.fields.push_back(std::move(f));
    }
    return r;
}

void compress_blk_to_comp(const std::vector<char> &blk,
                          std::vector<char> &comp,
                          int level)
{
    uLong srcLen = static_cast<uLong>(blk.size());
    uLong bound = compressBound(srcLen);
    comp.resize(bound);

    int ret = compress2(reinterpret_cast<Bytef *>(comp.data()), &bound,
                        reinterpret_cast<const Bytef *>(blk.data()), srcLen, level);

    if (ret != Z_OK)
    {
        throw ContainerError("zlib compress2 failed: " + std::to_string(ret));
    }

    comp.resize(bound);
}

void decompress_comp_to_blk(const std::vector<char> &comp,
                            std::vector<char> &blk,
                            uint32_t orig_size)
{
    uLong destLen = orig_size;
    blk.resize(destLen);

    int ret = uncompress(
        reinterpret_cast<Bytef *>(blk.data()),
        &destLen,
        reinterpret_cast<const Bytef *>(comp.data()),
        static_cast<uLong>(comp.size()));

    if (ret != Z_OK)
    {
        throw ContainerError("zlib uncompress failed: " + std::to_string(ret));
    }
    if (destLen != orig_size)
    {
        throw ContainerError("Block inflated to " + std::to_string(destLen)
                             + " bytes, header says " + std::to_string(orig_size));
    }
}

// ── Reader ──────────────────────────────────────────────────────────────────

ContainerReader::ContainerReader(const std::string &path)
    : path_(path), in_(path, std::ios::binary)
{
    if (!in_.is_open())
        throw RedactError(ErrorCode::IOFailure, "Cannot open container: " + path);

    char hdr[16];
    in_.read(hdr, sizeof(hdr));
    if (in_.gcount() != static_cast<std::streamsize>(sizeof(hdr)))
        throw ContainerError("Truncated container header: " + path);
    if (std::memcmp(hdr, kContainerMagic, 4) != 0)
        throw ContainerError("Invalid container format: " + path);

    const char *p = hdr + 4;
    header_.version = read_u32_mem(p);
    header_.compression_level = read_u32_mem(p);
    header_.flags = read_u32_mem(p);

    if (header_.version != kContainerVersion)
        throw ContainerError("Unsupported container version " + std::to_string(header_.version) + ": " + path);
    if (header_.compression_level > 9)
        throw ContainerError("Invalid compression level " + std::to_string(header_.compression_level) + ": " + path);
}

bool ContainerReader::load_next_block()
{
    if (in_.peek() == EOF)
        return false;

    char hdr[12];
    in_.read(hdr, sizeof(hdr));
    if (in_.gcount() != static_cast<std::streamsize>(sizeof(hdr)))
        throw ContainerError("Truncated block header at block#" + std::to_string(blocks_read_));

    const char *p = hdr;
    auto blk = std::make_shared<RawBlock>();
    blk->record_count = read_u32_mem(p);
    blk->raw_size = read_u32_mem(p);
    uint32_t comp_size = read_u32_mem(p);

    if (blk->record_count == 0)
        throw ContainerError("Empty block#" + std::to_string(blocks_read_));
    if (blk->raw_size > kMaxRawBlockSize || comp_size > compressBound(blk->raw_size))
        throw ContainerError("Block#" + std::to_string(blocks_read_) + " too large: " + std::to_string(blk->raw_size));

    blk->comp.resize(comp_size);
    in_.read(blk->comp.data(), comp_size);
    if (static_cast<size_t>(in_.gcount()) < comp_size)
        throw ContainerError("Truncated block#" + std::to_string(blocks_read_));

    decompress_comp_to_blk(blk->comp, raw_, blk->raw_size);

    block_ = std::move(blk);
    offset_ = 0;
    index_in_block_ = 0;
    ++blocks_read_;
    return true;
}

std::optional<LogRecord> ContainerReader::next()
{
    while (!block_ || index_in_block_ >= block_->record_count)
    {
        if (block_ && offset_ != raw_.size())
            throw ContainerError("Trailing bytes after last record of block#" + std::to_string(blocks_read_ - 1));
        if (!load_next_block())
            return std::nullopt;
    }

    LogRecord r = decode_record(raw_, offset_);
    r.origin = block_;
    r.origin_index = index_in_block_++;
    return r;
}

// ── Writer ──────────────────────────────────────────────────────────────────

ContainerWriter::ContainerWriter(const std::string &path,
                                 const ContainerHeader &header,
                                 size_t records_per_block)
    : path_(path),
      out_(path, std::ios::binary | std::ios::trunc),
      header_(header),
      records_per_block_(records_per_block == 0 ? kDefaultRecordsPerBlock : records_per_block)
{
    if (!out_.is_open())
        throw RedactError(ErrorCode::IOFailure, "Cannot create container: " + path);

    std::vector<char> hdr(kContainerMagic, kContainerMagic + 4);
    write_u32(hdr, header_.version);
    write_u32(hdr, header_.compression_level);
    write_u32(hdr, header_.flags);
    out_.write(hdr.data(), hdr.size());
}

void ContainerWriter::write(const LogRecord &record)
{
    if (closed_)
        throw ContainerError("Write after close: " + path_);

    // A record from a different source block starts a new block.
    if (!pending_.empty() && pending_.front().origin != record.origin)
        flush_block();

    pending_.push_back(record);

    if (record.origin)
    {
        if (record.origin_index + 1 >= record.origin->record_count)
            flush_block();
    }
    else if (pending_.size() >= records_per_block_)
    {
        flush_block();
    }
}

bool ContainerWriter::pending_is_pristine() const
{
    const auto &origin = pending_.front().origin;
    if (!origin || pending_.size() != origin->record_count)
        return false;
    for (size_t i = 0; i < pending_.size(); ++i)
    {
        const LogRecord &r = pending_[i];
        if (r.dirty || r.origin != origin || r.origin_index != i)
            return false;
    }
    return true;
}

void ContainerWriter::write_block(uint32_t record_count, uint32_t raw_size, const std::vector<char> &comp)
{
    std::vector<char> hdr;
    write_u32(hdr, record_count);
    write_u32(hdr, raw_size);
    write_u32(hdr, static_cast<uint32_t>(comp.size()));
    out_.write(hdr.data(), hdr.size());
    out_.write(comp.data(), comp.size());
    if (!out_)
        throw ContainerError("Failed writing block to " + path_);
}

void ContainerWriter::flush_block()
{
    if (pending_.empty())
        return;

    if (pending_is_pristine())
    {
        // Nothing changed: emit the block exactly as it was read.
        const RawBlock &origin = *pending_.front().origin;
        write_block(origin.record_count, origin.raw_size, origin.comp);
        ++blocks_reused_;
    }
    else
    {
        std::vector<char> blk;
        for (const auto &r : pending_)
            encode_record(r, blk);
        if (blk.size() > kMaxRawBlockSize)
            throw ContainerError("Encoded block too large: " + std::to_string(blk.size()) + " bytes");

        std::vector<char> comp;
        compress_blk_to_comp(blk, comp, static_cast<int>(header_.compression_level));
        write_block(static_cast<uint32_t>(pending_.size()), static_cast<uint32_t>(blk.size()), comp);
        ++blocks_encoded_;
    }
    pending_.clear();
}

void ContainerWriter::close()
{
    if (closed_)
        return;
    flush_block();
    out_.flush();
    out_.close();
    closed_ = true;
    if (out_.fail())
        throw ContainerError("Failed closing " + path_);
}
