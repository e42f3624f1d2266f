#include <fstream>
#include <sieve/config/config_helpers.h>

namespace sieve::config {

std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file) {
        return config;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
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

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        // Remove inline comments outside of quotes
        bool inQuote = false;
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (c == '"' || c == '\'') {
                inQuote = !inQuote;
            } else if (c == '#' && !inQuote) {
                value = value.substr(0, i);
                break;
            }
        }

        if (key.empty()) {
            continue;
        }
        const std::string flatKey = currentSection.empty() ? key : currentSection + "." + key;
        config[flatKey] = unquote(value);
    }

    return config;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
        xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "sieve";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "sieve";
    }
    return std::filesystem::current_path() / ".sieve";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("SIEVE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace sieve::config
