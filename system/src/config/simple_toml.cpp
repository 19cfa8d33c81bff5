#include "config/simple_toml.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rollcall {

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

bool SimpleToml::load_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line, section;

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("Config: línea ignorada '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (!val.empty() && val.front() == '"') {
            auto close = val.find('"', 1);
            val = close == std::string::npos ? val.substr(1) : val.substr(1, close - 1);
        } else {
            // Comentario al final de la línea
            auto hash = val.find('#');
            if (hash != std::string::npos) val = trim(val.substr(0, hash));
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        spdlog::warn("Config: '{}' no es entero ('{}'), usando {}", key, it->second, def);
        return def;
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    try {
        return std::stof(it->second);
    } catch (const std::exception&) {
        spdlog::warn("Config: '{}' no es numérico ('{}'), usando {}", key, it->second, def);
        return def;
    }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    auto it = values.find(key);
    if (it == values.end()) return def;
    return it->second == "true" || it->second == "1";
}

}  // namespace rollcall
