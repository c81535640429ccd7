#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace citestream::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

inline std::string to_lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Flattened view of a TOML-subset file: "section.key" -> unquoted value.
/// Keys outside any section are stored without a prefix.
using FlatConfig = std::map<std::string, std::string>;

/// Parse a whole config file once. Returns nullopt if the file cannot be opened.
std::optional<FlatConfig> parse_config_file(const std::filesystem::path& config_path);

/// Parse config text held in memory (same grammar as parse_config_file).
FlatConfig parse_config_text(std::string_view text);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/citestream or ~/.config/citestream
std::filesystem::path get_config_dir();

/// Returns the user data directory (citation database)
/// Unix: $XDG_DATA_HOME/citestream or ~/.local/share/citestream
std::filesystem::path get_data_dir();

/// Environment variable name for a config key: ("rag", "top_k_results") ->
/// "CITESTREAM_RAG_TOP_K_RESULTS".
std::string env_var_name(const std::string& section, const std::string& key);

} // namespace citestream::config
