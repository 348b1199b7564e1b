#include "container.hpp"
#include "error_code.hpp"
#include "test_util.hpp"

static std::vector<LogRecord> sample_records(size_t n)
{
    std::vector<LogRecord> records;
    for (size_t i = 0; i < n; ++i)
    {
        records.push_back(make_record(RecordKind::Message, 1000 + i,
                                      {{FieldKind::Text, "message " + std::to_string(i)},
                                       {FieldKind::Blob, std::string("\0\x01\x02", 3)}}));
    }
    return records;
}

static void write_container(const std::string &path, const std::vector<LogRecord> &records,
                            size_t per_block, int level = 9)
{
    ContainerHeader header;
    header.compression_level = static_cast<uint32_t>(level);
    header.flags = 0xABCD;
    ContainerWriter writer(path, header, per_block);
    for (const auto &r : records)
        writer.write(r);
    writer.close();
}

static std::vector<LogRecord> read_all(const std::string &path)
{
    std::vector<LogRecord> out;
    ContainerReader reader(path);
    while (auto r = reader.next())
        out.push_back(std::move(*r));
    return out;
}

template <typename F>
static bool throws_container_error(F f)
{
    try
    {
        f();
    }
    catch (const ContainerError &)
    {
        return true;
    }
    return false;
}

int main()
{
    auto dir = scratch_dir("container");
    const std::string original = (dir / "original.blgz").string();
    auto records = sample_records(10);
    write_container(original, records, 4);

    // Records come back in order, with their header, blocks of 4/4/2.
    {
        ContainerReader reader(original);
        CHECK(reader.header().version == kContainerVersion);
        CHECK(reader.header().compression_level == 9);
        CHECK(reader.header().flags == 0xABCD);

        size_t i = 0;
        while (auto r = reader.next())
        {
            CHECK(r->kind == RecordKind::Message);
            CHECK(r->timestamp == 1000 + i);
            CHECK(r->fields.size() == 2);
            CHECK(*r->fields[0].value == "message " + std::to_string(i));
            CHECK(*r->fields[1].value == std::string("\0\x01\x02", 3));
            CHECK(r->fields[1].kind == FieldKind::Blob);
            CHECK(r->origin != nullptr);
            CHECK(r->origin_index == i % 4);
            ++i;
        }
        CHECK(i == 10);
        CHECK(reader.blocks_read() == 3);
        CHECK(!reader.next());
    }

    // Copying a container without changes reuses every block verbatim.
    {
        const std::string copy = (dir / "copy.blgz").string();
        ContainerReader reader(original);
        ContainerWriter writer(copy, reader.header());
        while (auto r = reader.next())
            writer.write(*r);
        writer.close();
        CHECK(writer.blocks_reused() == 3);
        CHECK(writer.blocks_encoded() == 0);
        CHECK(read_file(copy) == read_file(original));
    }

    // Verbatim reuse holds even when the source was written at another level.
    {
        const std::string fast = (dir / "fast.blgz").string();
        const std::string copy = (dir / "fast_copy.blgz").string();
        write_container(fast, records, 3, 1);
        ContainerReader reader(fast);
        ContainerWriter writer(copy, reader.header(), 7);
        while (auto r = reader.next())
            writer.write(*r);
        writer.close();
        CHECK(read_file(copy) == read_file(fast));
    }

    // A dirty record re-encodes only its own block.
    {
        const std::string edited = (dir / "edited.blgz").string();
        ContainerReader reader(original);
        ContainerWriter writer(edited, reader.header());
        while (auto r = reader.next())
        {
            if (r->timestamp == 1005)
            {
                r->fields[0].value = make_text("changed");
                r->dirty = true;
            }
            writer.write(*r);
        }
        writer.close();
        CHECK(writer.blocks_reused() == 2);
        CHECK(writer.blocks_encoded() == 1);

        auto back = read_all(edited);
        CHECK(back.size() == 10);
        CHECK(*back[5].fields[0].value == "changed");
        CHECK(*back[6].fields[0].value == "message 6");
        CHECK(back[4].origin == back[7].origin);
    }

    // Canonical encoding: re-encoding unchanged records reproduces the block bytes.
    {
        const std::string reencoded = (dir / "reencoded.blgz").string();
        ContainerReader reader(original);
        ContainerWriter writer(reencoded, reader.header());
        while (auto r = reader.next())
        {
            r->dirty = true;
            writer.write(*r);
        }
        writer.close();
        CHECK(writer.blocks_encoded() == 3);
        CHECK(read_file(reencoded) == read_file(original));
    }

    // Corrupt and foreign input
    {
        const std::string bad_magic = (dir / "bad_magic.blgz").string();
        {
            std::ofstream out(bad_magic, std::ios::binary);
            out << "TCDZ0000000000000000";
        }
        CHECK(throws_container_error([&] { ContainerReader r(bad_magic); }));

        std::string bytes = read_file(original);
        const std::string truncated = (dir / "truncated.blgz").string();
        {
            std::ofstream out(truncated, std::ios::binary);
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size() - 5));
        }
        CHECK(throws_container_error([&] {
            ContainerReader r(truncated);
            while (r.next())
            {
            }
        }));

        // flip a byte inside the first compressed block
        const std::string flipped = (dir / "flipped.blgz").string();
        std::string damaged = bytes;
        damaged[16 + 12 + 4] = static_cast<char>(damaged[16 + 12 + 4] ^ 0x5A);
        {
            std::ofstream out(flipped, std::ios::binary);
            out.write(damaged.data(), static_cast<std::streamsize>(damaged.size()));
        }
        CHECK(throws_container_error([&] {
            ContainerReader r(flipped);
            while (r.next())
            {
            }
        }));
    }

    // Record decoding rejects unknown kinds and short fields.
    {
        std::vector<char> blk;
        encode_record(sample_records(1)[0], blk);
        size_t offset = 0;
        LogRecord r = decode_record(blk, offset);
        CHECK(offset == blk.size());
        CHECK(r.fields.size() == 2);

        std::vector<char> bad_kind = blk;
        bad_kind[0] = 99;
        offset = 0;
        CHECK(throws_container_error([&] { decode_record(bad_kind, offset); }));

        std::vector<char> short_blk(blk.begin(), blk.end() - 1);
        offset = 0;
        CHECK(throws_container_error([&] { decode_record(short_blk, offset); }));
    }

    // Missing file
    {
        bool io_failure = false;
        try
        {
            ContainerReader r((dir / "missing.blgz").string());
        }
        catch (const RedactError &e)
        {
            io_failure = e.code() == ErrorCode::IOFailure;
        }
        CHECK(io_failure);
    }

    std::filesystem::remove_all(dir);
    return finish("test_container");
}
