#pragma once

#include <string>

#include "redactor.hpp"

// Merge a JSON configuration file into options. Recognized keys:
//   patterns (array of strings, appended), overwrite, disable_builtin_patterns,
//   identify_replacements, ignore_case (booleans), summary_json, audit_db (strings).
// Returns false and logs the reason if the file is missing or malformed.
bool load_config_file(const std::string &path, RedactOptions &options);
