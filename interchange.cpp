#include "interchange.hpp"
#include "container.hpp"
#include "error_code.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    // Don't leave a half-written container behind.
    void discard(const std::string &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    LogRecord record_from_json(const json &j)
    {
        LogRecord r;
        if (!parse_record_kind(j.at("kind").get<std::string>(), r.kind))
            throw std::runtime_error("unknown record kind '" + j.at("kind").get<std::string>() + "'");
        r.timestamp = j.value("timestamp", uint64_t{0});

        if (!j.contains("fields"))
            return r;
        for (const auto &jf : j.at("fields"))
        {
            RecordField f;
            if (!parse_field_kind(jf.at("kind").get<std::string>(), f.kind))
                throw std::runtime_error("unknown field kind '" + jf.at("kind").get<std::string>() + "'");
            f.value = make_text(jf.at("value").get<std::string>());
            r.fields.push_back(std::move(f));
        }
        return r;
    }

    json record_to_json(const LogRecord &r)
    {
        json j;
        j["kind"] = record_kind_name(r.kind);
        j["timestamp"] = r.timestamp;
        j["fields"] = json::array();
        for (const auto &f : r.fields)
        {
            j["fields"].push_back({{"kind", field_kind_name(f.kind)},
                                   {"value", f.value ? *f.value : std::string()}});
        }
        return j;
    }
}

bool pack_jsonl(const std::string &jsonl_path,
                const std::string &container_path,
                int compression_level)
{
    if (compression_level < 0 || compression_level > 9)
    {
        std::cerr << "❌ Invalid compression level: " << compression_level << "\n";
        return false;
    }

    std::ifstream in(jsonl_path);
    if (!in)
    {
        std::cerr << "File open failed: " << jsonl_path << "\n";
        return false;
    }

    ContainerHeader header;
    header.compression_level = static_cast<uint32_t>(compression_level);

    size_t records = 0;
    try
    {
        ContainerWriter writer(container_path, header);
        std::string line;
        size_t lineno = 0;
        while (std::getline(in, line))
        {
            ++lineno;
            if (line.empty())
                continue;
            try
            {
                writer.write(record_from_json(json::parse(line)));
            }
            catch (const std::exception &e)
            {
                std::cerr << "❌ " << jsonl_path << ":" << lineno << ": " << e.what() << "\n";
                discard(container_path);
                return false;
            }
            ++records;
        }
        writer.close();
    }
    catch (const std::exception &e)
    {
        std::cerr << "❌ Pack failed: " << e.what() << "\n";
        discard(container_path);
        return false;
    }

    std::cout << "📦 Packed " << records << " records into " << container_path << "\n";
    return true;
}

bool dump_container(const std::string &container_path, std::ostream &out)
{
    try
    {
        ContainerReader reader(container_path);
        while (auto r = reader.next())
            out << record_to_json(*r).dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "❌ Dump failed: " << e.what() << "\n";
        return false;
    }
    return true;
}
