#include "config/run_config.h"
#include "common/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dts {
namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

bool to_double(const std::string& text, double& out) {
    std::string t = trim(text);
    if (t.empty()) return false;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (*end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

std::string strip_brackets(const std::string& text) {
    std::string t = trim(text);
    if (t.size() >= 2 &&
        ((t.front() == '(' && t.back() == ')') || (t.front() == '[' && t.back() == ']')))
        t = trim(t.substr(1, t.size() - 2));
    return t;
}

[[noreturn]] void bad_value(const ConfigSection& s, const std::string& key,
                            const std::string& what) {
    throw SimError(ErrorKind::MALFORMED_INPUT,
                   "[" + s.name + "] " + key + ": " + what);
}

} // anonymous namespace

bool parse_point(const std::string& text, Coordinate& out) {
    std::vector<double> values;
    if (!parse_number_list(text, values) || values.size() != 2)
        return false;
    out = Coordinate{values[0], values[1]};
    return true;
}

bool parse_number_list(const std::string& text, std::vector<double>& out) {
    std::string inner = strip_brackets(text);
    if (inner.empty())
        return false;

    std::vector<double> result;
    std::stringstream ss(inner);
    std::string item;
    while (std::getline(ss, item, ',')) {
        double v;
        if (!to_double(item, v))
            return false;
        result.push_back(v);
    }
    out = std::move(result);
    return true;
}

// --- ConfigSection ---

const std::string* ConfigSection::find(const std::string& key) const {
    const std::string k = lower(key);
    for (const auto& kv : entries) {
        if (kv.first == k)
            return &kv.second;
    }
    return nullptr;
}

bool ConfigSection::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string ConfigSection::get(const std::string& key) const {
    const std::string* v = find(key);
    if (!v)
        bad_value(*this, key, "missing");
    return *v;
}

double ConfigSection::get_number(const std::string& key) const {
    double v;
    if (!to_double(get(key), v))
        bad_value(*this, key, "not a number: '" + get(key) + "'");
    return v;
}

int ConfigSection::get_int(const std::string& key) const {
    double v = get_number(key);
    if (v != std::floor(v))
        bad_value(*this, key, "not an integer: '" + get(key) + "'");
    return static_cast<int>(v);
}

Coordinate ConfigSection::get_point(const std::string& key) const {
    Coordinate c;
    if (!parse_point(get(key), c))
        bad_value(*this, key, "expected 'lat, lon', got '" + get(key) + "'");
    return c;
}

std::vector<double> ConfigSection::get_number_list(const std::string& key) const {
    std::vector<double> values;
    if (!parse_number_list(get(key), values))
        bad_value(*this, key, "expected a comma separated list, got '" + get(key) + "'");
    return values;
}

std::string ConfigSection::get_or(const std::string& key, const std::string& fallback) const {
    const std::string* v = find(key);
    return v ? *v : fallback;
}

double ConfigSection::get_number_or(const std::string& key, double fallback) const {
    return has(key) ? get_number(key) : fallback;
}

int ConfigSection::get_int_or(const std::string& key, int fallback) const {
    return has(key) ? get_int(key) : fallback;
}

const ConfigSection* RunConfig::find(const std::string& name) const {
    for (const auto& s : sections) {
        if (s.name == name)
            return &s;
    }
    return nullptr;
}

// --- Loading ---

RunConfig load_run_config_from_string(const std::string& content) {
    RunConfig cfg;

    std::istringstream stream(content);
    std::string line;
    int line_no = 0;
    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[') {
            if (line.back() != ']')
                throw std::runtime_error("Line " + std::to_string(line_no) + ": unterminated section header");
            std::string name = trim(line.substr(1, line.size() - 2));
            if (name.empty())
                throw std::runtime_error("Line " + std::to_string(line_no) + ": empty section name");
            if (cfg.find(name))
                throw std::runtime_error("Line " + std::to_string(line_no) + ": duplicate section [" + name + "]");
            ConfigSection section;
            section.name = name;
            section.line = line_no;
            cfg.sections.push_back(std::move(section));
            continue;
        }

        auto sep = line.find_first_of("=:");
        if (sep == std::string::npos)
            throw std::runtime_error("Line " + std::to_string(line_no) + ": expected 'key = value'");
        if (cfg.sections.empty())
            throw std::runtime_error("Line " + std::to_string(line_no) + ": key outside of any section");

        std::string key = lower(trim(line.substr(0, sep)));
        std::string value = trim(line.substr(sep + 1));
        if (key.empty())
            throw std::runtime_error("Line " + std::to_string(line_no) + ": empty key");

        auto& entries = cfg.sections.back().entries;
        auto existing = std::find_if(entries.begin(), entries.end(),
            [&key](const std::pair<std::string, std::string>& kv) { return kv.first == key; });
        if (existing != entries.end())
            existing->second = value;
        else
            entries.emplace_back(key, value);
    }

    return cfg;
}

RunConfig load_run_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open run file: " + path);

    std::ostringstream ss;
    ss << file.rdbuf();
    return load_run_config_from_string(ss.str());
}

} // namespace dts
