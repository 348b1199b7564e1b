#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "record.hpp"

static int g_failures = 0;

#define CHECK(cond)                                                              \
    do                                                                           \
    {                                                                            \
        if (!(cond))                                                             \
        {                                                                        \
            std::cerr << "❌ " << __FILE__ << ":" << __LINE__ << ": " #cond "\n"; \
            ++g_failures;                                                        \
        }                                                                        \
    } while (0)

inline int finish(const char *name)
{
    if (g_failures == 0)
        std::cout << "✅ " << name << " passed\n";
    else
        std::cerr << "❌ " << name << ": " << g_failures << " check(s) failed\n";
    return g_failures == 0 ? 0 : 1;
}

inline LogRecord make_record(RecordKind kind, uint64_t ts,
                             std::vector<std::pair<FieldKind, std::string>> fields)
{
    LogRecord r;
    r.kind = kind;
    r.timestamp = ts;
    for (auto &f : fields)
        r.fields.push_back({f.first, make_text(std::move(f.second))});
    return r;
}

inline std::string read_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Fresh, empty scratch directory under the system temp dir.
inline std::filesystem::path scratch_dir(const std::string &name)
{
    auto dir = std::filesystem::temp_directory_path() / ("logscrub_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}
