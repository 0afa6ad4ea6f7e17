#pragma once

#include <cstdlib>
#include <fstream>
#include <string>
#include <unordered_map>

namespace bayestext {

inline std::string trim_ws(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Load KEY=VALUE pairs from a .env file. Missing file -> empty map.
// Lines starting with '#' are comments; an "export " prefix is allowed;
// one level of matching quotes around the value is removed.
inline std::unordered_map<std::string, std::string> load_env_file(const std::string& path) {
    std::unordered_map<std::string, std::string> vars;

    std::ifstream in(path);
    if (!in) return vars;

    std::string line;
    while (std::getline(in, line)) {
        line = trim_ws(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.rfind("export ", 0) == 0) line = trim_ws(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim_ws(line.substr(0, eq));
        std::string value = trim_ws(line.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        vars[key] = value;
    }
    return vars;
}

// .env value first, then the process environment, then the fallback
inline std::string env_or(const std::unordered_map<std::string, std::string>& vars,
                          const std::string& key,
                          const std::string& fallback = "") {
    auto it = vars.find(key);
    if (it != vars.end() && !it->second.empty()) return it->second;
    if (const char* p = std::getenv(key.c_str())) {
        if (*p) return p;
    }
    return fallback;
}

} // namespace bayestext
