#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/utils.hpp"
#include <fstream>
#include <iterator>

namespace exchange {

// Simple JSON-like parser (no external dependency for core config)
// Supports: {"key": value, "key": "string", "key": true}
namespace {

size_t parse_size(const std::string& key, const std::string& s) {
    size_t pos = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(s, &pos);
    } catch (const std::logic_error&) {
        throw ParseError("config key '" + key + "': expected an integer, got '" + s + "'");
    }
    if (pos != s.size() || s.front() == '-') {
        throw ParseError("config key '" + key + "': expected an integer, got '" + s + "'");
    }
    return static_cast<size_t>(value);
}

bool parse_bool(const std::string& key, const std::string& s) {
    const std::string v = to_upper_ascii(s);
    if (v == "TRUE" || v == "1") return true;
    if (v == "FALSE" || v == "0") return false;
    throw ParseError("config key '" + key + "': expected true/false, got '" + s + "'");
}

} // anonymous namespace

SimConfig default_config() {
    return SimConfig{};
}

SimConfig load_config(const std::string& path) {
    SimConfig config = default_config();

    std::ifstream file(path);
    if (!file.is_open()) {
        return config; // Return defaults if file not found
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    // Minimal key-value extraction from JSON
    auto extract_value = [&](const std::string& key) -> std::string {
        std::string search_key = "\"" + key + "\"";
        size_t pos = content.find(search_key);
        if (pos == std::string::npos) return "";
        pos = content.find(':', pos);
        if (pos == std::string::npos) return "";
        pos++;
        while (pos < content.size() && (content[pos] == ' ' || content[pos] == '\t')) pos++;
        if (pos >= content.size()) return "";

        if (content[pos] == '"') {
            size_t end = content.find('"', pos + 1);
            if (end == std::string::npos) return "";
            return content.substr(pos + 1, end - pos - 1);
        }

        size_t end = content.find_first_of(",}\n", pos);
        if (end == std::string::npos) end = content.size();
        return std::string(trim(std::string_view(content).substr(pos, end - pos)));
    };

    auto try_string = [&](const std::string& key, std::string& target) {
        std::string val = extract_value(key);
        if (!val.empty()) target = val;
    };

    auto try_size = [&](const std::string& key, size_t& target) {
        std::string val = extract_value(key);
        if (!val.empty()) target = parse_size(key, val);
    };

    auto try_bool = [&](const std::string& key, bool& target) {
        std::string val = extract_value(key);
        if (!val.empty()) target = parse_bool(key, val);
    };

    // Logging
    std::string level = extract_value("log_level");
    if (!level.empty()) config.log_level = parse_log_level(level);
    try_string("log_file", config.log_file);

    // Books
    try_size("random_symbol_length", config.random_symbol_length);
    if (config.random_symbol_length == 0 || config.random_symbol_length > MAX_SYMBOL_LENGTH) {
        throw ParseError("config key 'random_symbol_length': must be between 1 and " +
                         std::to_string(MAX_SYMBOL_LENGTH));
    }

    // Runtime
    try_string("script_path", config.script_path);
    try_bool("display_books", config.display_books);

    config.config_path = path;
    return config;
}

} // namespace exchange
