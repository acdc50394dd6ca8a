// ============= include/simple_toml.hpp =============
#pragma once
#include <fstream>
#include <map>
#include <string>

// Lector TOML minimo: solo [seccion] y clave = valor.
// Las claves quedan como "seccion.clave".
class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    // Quita comentario final fuera de comillas
    static std::string strip_comment(const std::string& s) {
        bool in_quotes = false;
        for (size_t i = 0; i < s.size(); i++) {
            if (s[i] == '"') in_quotes = !in_quotes;
            if (s[i] == '#' && !in_quotes) return s.substr(0, i);
        }
        return s;
    }

public:
    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) return false;

        std::string line, section;
        while (std::getline(file, line)) {
            line = trim(strip_comment(line));
            if (line.empty()) continue;

            if (line[0] == '[' && line.back() == ']') {
                section = trim(line.substr(1, line.length() - 2));
                continue;
            }

            auto eq = line.find('=');
            if (eq != std::string::npos) {
                std::string key = trim(line.substr(0, eq));
                std::string val = trim(line.substr(eq + 1));

                if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
                    val = val.substr(1, val.length() - 2);
                }

                std::string full_key = section.empty() ? key : section + "." + key;
                values[full_key] = val;
            }
        }
        return true;
    }

    void set(const std::string& key, const std::string& val) { values[key] = val; }

    bool has(const std::string& key) const { return values.count(key) != 0; }

    std::string get(const std::string& key, const std::string& def = "") const {
        auto it = values.find(key);
        return it != values.end() ? it->second : def;
    }

    int get_int(const std::string& key, int def = 0) const {
        auto it = values.find(key);
        if (it == values.end()) return def;
        return std::stoi(it->second);
    }

    bool get_bool(const std::string& key, bool def = false) const {
        auto it = values.find(key);
        if (it == values.end()) return def;
        return it->second == "true" || it->second == "1";
    }
};
