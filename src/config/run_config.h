#pragma once
#include "synth/geodesy.h"
#include <string>
#include <utility>
#include <vector>

namespace dts {

// One [Name] block of a run file. Keys are stored lower-case.
struct ConfigSection {
    std::string name;
    int         line = 0;
    std::vector<std::pair<std::string, std::string>> entries;

    bool has(const std::string& key) const;
    const std::string* find(const std::string& key) const;

    // Required accessors throw SimError(MALFORMED_INPUT) naming the
    // section and key when the key is missing or its value does not parse.
    std::string get(const std::string& key) const;
    double      get_number(const std::string& key) const;
    int         get_int(const std::string& key) const;
    Coordinate  get_point(const std::string& key) const;
    std::vector<double> get_number_list(const std::string& key) const;

    std::string get_or(const std::string& key, const std::string& fallback) const;
    double      get_number_or(const std::string& key, double fallback) const;
    int         get_int_or(const std::string& key, int fallback) const;
};

struct RunConfig {
    std::vector<ConfigSection> sections;   // file order

    const ConfigSection* find(const std::string& name) const;
};

// Load an INI-style run file: [Section] headers, "key = value" (or
// "key: value") lines, '#' / ';' comments.
// Throws std::runtime_error on file-not-found, a key outside any section,
// a line without separator or a duplicated section.
RunConfig load_run_config(const std::string& path);

// Load from a string (for testing without files).
RunConfig load_run_config_from_string(const std::string& content);

// "lat, lon" or "(lat, lon)". Returns false on anything else.
bool parse_point(const std::string& text, Coordinate& out);

// Comma separated numbers, optional surrounding brackets.
bool parse_number_list(const std::string& text, std::vector<double>& out);

} // namespace dts
