// ============= include/config/simple_toml.hpp =============
/*
 * Lector TOML minimalista
 *
 * Soporta:
 *   [seccion]
 *   clave = valor        -> "seccion.clave"
 *   clave = "texto"      -> comillas removidas
 *   # comentarios
 */

#pragma once
#include <map>
#include <string>

namespace rollcall {

class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);

public:
    bool load(const std::string& filename);
    bool load_string(const std::string& content);

    bool has(const std::string& key) const { return values.count(key) > 0; }

    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;

    void set(const std::string& key, const std::string& value) { values[key] = value; }
};

}  // namespace rollcall
