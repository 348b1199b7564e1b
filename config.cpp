#include "config.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    void read_flag(const json &j, const char *key, bool &out)
    {
        if (j.contains(key))
            out = j.at(key).get<bool>();
    }

    void read_string(const json &j, const char *key, std::string &out)
    {
        if (j.contains(key))
            out = j.at(key).get<std::string>();
    }
}

bool load_config_file(const std::string &path, RedactOptions &options)
{
    std::ifstream in(path);
    if (!in)
    {
        std::cerr << "❌ Failed to open config file: " << path << "\n";
        return false;
    }

    try
    {
        json j;
        in >> j;
        if (!j.is_object())
        {
            std::cerr << "❌ Config must be a JSON object: " << path << "\n";
            return false;
        }

        if (j.contains("patterns"))
        {
            if (!j.at("patterns").is_array())
            {
                std::cerr << "❌ \"patterns\" must be an array of strings: " << path << "\n";
                return false;
            }
            for (const auto &p : j.at("patterns"))
                options.explicit_patterns.push_back(p.get<std::string>());
        }
        read_flag(j, "overwrite", options.overwrite);
        read_flag(j, "disable_builtin_patterns", options.disable_builtin_patterns);
        read_flag(j, "identify_replacements", options.identify_replacements);
        read_flag(j, "ignore_case", options.ignore_case);
        read_string(j, "summary_json", options.summary_json_path);
        read_string(j, "audit_db", options.audit_db_path);
    }
    catch (const json::exception &e)
    {
        std::cerr << "❌ Failed to parse config " << path << ": " << e.what() << "\n";
        return false;
    }
    return true;
}
