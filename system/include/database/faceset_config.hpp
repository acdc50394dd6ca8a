// ============= include/database/faceset_config.hpp =============
#pragma once
#include "codec/image_codec.hpp"
#include <spdlog/spdlog.h>
#include <string>

class SimpleToml;

struct FacesetConfig {
    int busy_timeout_ms;
    std::string journal_mode;     // DELETE, TRUNCATE, PERSIST, WAL...
    bool create_dirs;
    ImageFormat default_format;
    int default_quality;
    QualityCheck quality_check;

    FacesetConfig()
        : busy_timeout_ms(5000),
          journal_mode("DELETE"),  // un solo archivo, sin -wal/-shm
          create_dirs(true),
          default_format(ImageFormat::WEBP),
          default_quality(100),
          quality_check(QualityCheck::STRICT) {}

    // Seccion [faceset]. Lanza std::invalid_argument con valores invalidos
    static FacesetConfig from_toml(const SimpleToml& toml);
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%H:%M:%S] [%l] %v";

    // Seccion [log]
    static LogConfig from_toml(const SimpleToml& toml);

    void apply() const;
};
