#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "error_code.hpp"
#include "file_system.hpp"
#include "interchange.hpp"
#include "pattern_catalog.hpp"
#include "redactor.hpp"

static std::atomic<bool> g_cancel{false};

static void on_sigint(int)
{
    g_cancel.store(true);
}

static void print_usage(const char *argv0)
{
    std::cerr << "Usage:\n"
              << "  " << argv0 << " redact   -i <input> [-o <output>] [options] [pattern ...]\n"
              << "  " << argv0 << " dump     <container>\n"
              << "  " << argv0 << " pack     <records.jsonl> <container> [--level N]\n"
              << "  " << argv0 << " patterns\n"
              << "\nredact options:\n"
              << "  -f, --overwrite        replace an existing output file\n"
              << "  --no-builtin           only redact the explicit patterns\n"
              << "  --identify             number the markers: <REDACTED:N>\n"
              << "  --ignore-case          match explicit patterns case-insensitively\n"
              << "  --dry-run              scan only, write nothing\n"
              << "  --summary-json <path>  write the run summary as JSON\n"
              << "  --audit-db <path>      record every redaction in a SQLite database\n"
              << "  --config <path>        read options from a JSON file\n"
              << "  -v, --verbose\n";
}

// Returns false on a usage error. Exits through InvalidOptions.
static bool parse_redact_args(int argc, char *argv[], RedactOptions &opts)
{
    // The config file is applied first so command-line values win.
    for (int i = 2; i < argc; i++)
    {
        if (std::string(argv[i]) == "--config")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for --config\n";
                return false;
            }
            if (!load_config_file(argv[i + 1], opts))
                return false;
        }
    }

    for (int i = 2; i < argc; i++)
    {
        std::string arg = argv[i];
        auto value = [&](std::string &out) {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-i" || arg == "--input")
        {
            if (!value(opts.input_path))
                return false;
        }
        else if (arg == "-o" || arg == "--output")
        {
            if (!value(opts.output_file_name))
                return false;
        }
        else if (arg == "-f" || arg == "--overwrite")
            opts.overwrite = true;
        else if (arg == "--no-builtin")
            opts.disable_builtin_patterns = true;
        else if (arg == "--identify")
            opts.identify_replacements = true;
        else if (arg == "--ignore-case")
            opts.ignore_case = true;
        else if (arg == "--dry-run")
            opts.dry_run = true;
        else if (arg == "-v" || arg == "--verbose")
            opts.verbose = true;
        else if (arg == "--summary-json")
        {
            if (!value(opts.summary_json_path))
                return false;
        }
        else if (arg == "--audit-db")
        {
            if (!value(opts.audit_db_path))
                return false;
        }
        else if (arg == "--config")
        {
            ++i; // already loaded
        }
        else if (arg == "--")
        {
            for (++i; i < argc; i++)
                opts.explicit_patterns.push_back(argv[i]);
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        else
        {
            opts.explicit_patterns.push_back(arg);
        }
    }
    return true;
}

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return static_cast<int>(ErrorCode::InvalidOptions);
    }

    std::string command = argv[1];
    if (command == "redact")
    {
        RedactOptions opts;
        if (!parse_redact_args(argc, argv, opts))
        {
            print_usage(argv[0]);
            return static_cast<int>(ErrorCode::InvalidOptions);
        }

        std::signal(SIGINT, on_sigint);
        PhysicalFileSystem fs;
        Redactor redactor(fs);
        return static_cast<int>(redactor.execute(opts, &g_cancel));
    }
    else if (command == "dump")
    {
        if (argc < 3)
        {
            std::cerr << "Not enough arguments for dump.\n";
            return static_cast<int>(ErrorCode::InvalidOptions);
        }
        return dump_container(argv[2], std::cout) ? 0 : static_cast<int>(ErrorCode::ProcessingFailed);
    }
    else if (command == "pack")
    {
        if (argc < 4)
        {
            std::cerr << "Not enough arguments for pack.\n";
            return static_cast<int>(ErrorCode::InvalidOptions);
        }
        int level = 9;
        if (argc >= 6 && std::string(argv[4]) == "--level")
        {
            try
            {
                level = std::stoi(argv[5]);
            }
            catch (const std::exception &)
            {
                std::cerr << "Invalid level: " << argv[5] << "\n";
                return static_cast<int>(ErrorCode::InvalidOptions);
            }
        }
        return pack_jsonl(argv[2], argv[3], level) ? 0 : static_cast<int>(ErrorCode::ProcessingFailed);
    }
    else if (command == "patterns")
    {
        std::cout << "Built-in patterns (v" << kBuiltinCatalogVersion << "):\n";
        for (BuiltinKind k : builtin_kinds())
            std::cout << "  " << builtin_name(k) << "  " << builtin_description(k) << "\n";
        return 0;
    }
    else
    {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return static_cast<int>(ErrorCode::InvalidOptions);
    }
}
