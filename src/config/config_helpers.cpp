#include <fstream>
#include <sstream>
#include <citestream/config/config_helpers.h>

namespace citestream::config {

namespace {

// Shared line grammar: "[section]", "key = value # comment", "section.key = value".
void parse_lines(std::istream& in, FlatConfig& out) {
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments, but not a '#' inside a quoted value
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        out[fullKey] = unquote(v);
    }
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto parsed = parse_config_file(config_path);
    if (!parsed) {
        return "";
    }
    auto it = parsed->find(section.empty() ? key : section + "." + key);
    if (it == parsed->end()) {
        return "";
    }
    return it->second;
}

std::optional<FlatConfig> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return std::nullopt;
    }
    FlatConfig out;
    parse_lines(file, out);
    return out;
}

FlatConfig parse_config_text(std::string_view text) {
    std::istringstream in{std::string(text)};
    FlatConfig out;
    parse_lines(in, out);
    return out;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "citestream";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "citestream";
    }
    return std::filesystem::current_path() / ".citestream";
}

std::filesystem::path get_data_dir() {
    if (const char* env = std::getenv("CITESTREAM_DATA_DIR"); env && *env) {
        return std::filesystem::path(env);
    }
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "citestream";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "citestream";
    }
    return std::filesystem::current_path() / "citestream_data";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("CITESTREAM_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

std::string env_var_name(const std::string& section, const std::string& key) {
    std::string name = "CITESTREAM_";
    for (const std::string* part : {&section, &key}) {
        for (unsigned char c : *part) {
            name.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
        }
        if (part == &section) {
            name.push_back('_');
        }
    }
    return name;
}

} // namespace citestream::config
