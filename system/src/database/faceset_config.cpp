#include "database/faceset_config.hpp"
#include "simple_toml.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static int parse_int(const SimpleToml& toml, const std::string& key, int def) {
    try {
        return toml.get_int(key, def);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(key + ": expected integer, got '" + toml.get(key) + "'");
    }
}

FacesetConfig FacesetConfig::from_toml(const SimpleToml& toml) {
    FacesetConfig cfg;

    cfg.busy_timeout_ms = parse_int(toml, "faceset.busy_timeout_ms", cfg.busy_timeout_ms);
    if (cfg.busy_timeout_ms < 0) {
        throw std::invalid_argument("faceset.busy_timeout_ms must be >= 0");
    }

    cfg.journal_mode = to_upper(toml.get("faceset.journal_mode", cfg.journal_mode));
    static const char* modes[] = {"DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
    if (std::find(std::begin(modes), std::end(modes), cfg.journal_mode) == std::end(modes)) {
        throw std::invalid_argument("faceset.journal_mode: unknown mode '" + cfg.journal_mode + "'");
    }

    cfg.create_dirs = toml.get_bool("faceset.create_dirs", cfg.create_dirs);

    std::string fmt = toml.get("faceset.default_format", image_codec::format_name(cfg.default_format));
    auto format = image_codec::parse_format(fmt);
    if (!format) {
        throw std::invalid_argument("faceset.default_format: unsupported format '" + fmt + "'");
    }
    cfg.default_format = *format;

    cfg.default_quality = parse_int(toml, "faceset.default_quality", cfg.default_quality);
    if (cfg.default_quality < 0 || cfg.default_quality > 100) {
        throw std::invalid_argument("faceset.default_quality must be in range [0..100]");
    }

    std::string check = toml.get("faceset.quality_check", "strict");
    if (check == "strict") {
        cfg.quality_check = QualityCheck::STRICT;
    } else if (check == "legacy") {
        cfg.quality_check = QualityCheck::LEGACY;
    } else {
        throw std::invalid_argument("faceset.quality_check must be 'strict' or 'legacy'");
    }

    return cfg;
}

LogConfig LogConfig::from_toml(const SimpleToml& toml) {
    LogConfig cfg;

    if (toml.has("log.level")) {
        std::string name = toml.get("log.level");
        auto level = spdlog::level::from_str(name);
        // from_str devuelve off para nombres desconocidos
        if (level == spdlog::level::off && name != "off") {
            throw std::invalid_argument("log.level: unknown level '" + name + "'");
        }
        cfg.level = level;
    }

    cfg.pattern = toml.get("log.pattern", cfg.pattern);
    return cfg;
}

void LogConfig::apply() const {
    spdlog::set_level(level);
    spdlog::set_pattern(pattern);
}
