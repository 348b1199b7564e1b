#pragma once

#include <ostream>
#include <string>

// JSON-lines interchange, one record per line:
//   {"kind":"Message","timestamp":1,"fields":[{"kind":"Text","value":"..."}]}

// Build a container from a JSON-lines file. Returns false (after logging) on failure.
bool pack_jsonl(const std::string &jsonl_path,
                const std::string &container_path,
                int compression_level = 9);

// Print every record of a container as JSON lines.
bool dump_container(const std::string &container_path, std::ostream &out);
