// ============= tools/faceset_tool.hpp =============
/*
 * Comandos de mantenimiento sobre un Faceset abierto
 *
 * - Estadisticas y listado de personas
 * - Chequeo de referencias colgantes
 * - Importar un directorio de imagenes / exportar como PNG
 */

#pragma once
#include "database/faceset.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>
#include <string>

class FacesetTool {
private:
    Faceset& faceset;

public:
    explicit FacesetTool(Faceset& faceset) : faceset(faceset) {}

    void show_statistics() {
        std::cout << "\n═══════════════════════════════════════════════" << std::endl;
        std::cout << "   FACESET " << faceset.get_path() << std::endl;
        std::cout << "═══════════════════════════════════════════════" << std::endl;
        std::cout << "Version:    " << faceset.get_version() << std::endl;
        std::cout << "FaceMarks:  " << faceset.face_mark_count() << std::endl;
        std::cout << "Persons:    " << faceset.person_count() << std::endl;
        std::cout << "Images:     " << faceset.image_count() << std::endl;

        std::error_code ec;
        auto size = std::filesystem::file_size(faceset.get_path(), ec);
        if (!ec) {
            std::cout << "Tamaño:     " << std::fixed << std::setprecision(2)
                      << size / 1024.0 / 1024.0 << " MB" << std::endl;
        }
        std::cout << "═══════════════════════════════════════════════\n" << std::endl;
    }

    void show_persons() {
        std::cout << std::left << std::setw(34) << "UUID" << std::setw(24) << "Name" << "Age" << std::endl;
        std::cout << std::string(64, '-') << std::endl;

        faceset.iter_persons([](const UPerson& p) {
            std::cout << std::left << std::setw(34) << p.uuid.to_hex()
                      << std::setw(24) << p.name;
            if (p.age) {
                std::cout << std::fixed << std::setprecision(1) << *p.age;
            } else {
                std::cout << "-";
            }
            std::cout << std::endl;
            return true;
        });
    }

    // 0 si no hay referencias colgantes
    int check() {
        auto dangling = faceset.check_integrity();
        if (dangling.empty()) {
            std::cout << "OK: todas las referencias resuelven" << std::endl;
            return 0;
        }

        for (const auto& ref : dangling) {
            std::cout << "UFaceMark " << ref.face_mark_uuid.to_hex();
            if (ref.missing_image_uuid) {
                std::cout << "  image " << ref.missing_image_uuid->to_hex() << " no existe";
            }
            if (ref.missing_person_uuid) {
                std::cout << "  person " << ref.missing_person_uuid->to_hex() << " no existe";
            }
            std::cout << std::endl;
        }
        std::cout << dangling.size() << " face marks con referencias colgantes" << std::endl;
        return 2;
    }

    int import_images(const std::string& dir) {
        static const std::set<std::string> exts = {".jpg", ".jpeg", ".png", ".webp", ".jp2", ".bmp"};

        if (!std::filesystem::is_directory(dir)) {
            spdlog::error("No es un directorio: {}", dir);
            return 1;
        }

        int imported = 0;
        int failed = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (!entry.is_regular_file()) continue;
            std::string ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (exts.count(ext) == 0) continue;

            UImage img;
            img.name = entry.path().filename().string();
            img.image = cv::imread(entry.path().string(), cv::IMREAD_UNCHANGED);
            if (img.image.empty()) {
                spdlog::warn("No se pudo leer {}", entry.path().string());
                failed++;
                continue;
            }

            try {
                faceset.add_image(img);
                imported++;
            } catch (const EncodeError& e) {
                spdlog::warn("{}: {}", img.name, e.what());
                failed++;
            }
        }

        spdlog::info("Importadas {} imagenes ({} fallidas)", imported, failed);
        return failed == 0 ? 0 : 2;
    }

    int export_images(const std::string& dir) {
        std::filesystem::create_directories(dir);

        int exported = 0;
        std::set<std::string> used;
        faceset.iter_images([&](const UImage& img) {
            std::string stem = img.name.empty() ? img.uuid.to_hex()
                                                : std::filesystem::path(img.name).stem().string();
            // a.jpg y a.png -> a.png y a_<uuid>.png
            bool taken = !used.insert(stem).second ||
                         std::filesystem::exists(std::filesystem::path(dir) / (stem + ".png"));
            if (taken) {
                stem += "_" + img.uuid.to_hex();
                used.insert(stem);
            }
            std::filesystem::path out = std::filesystem::path(dir) / (stem + ".png");
            if (cv::imwrite(out.string(), img.image)) {
                exported++;
            } else {
                spdlog::warn("No se pudo escribir {}", out.string());
            }
            return true;
        }, Faceset::ReadMode::SKIP_CORRUPT);

        spdlog::info("Exportadas {} imagenes a {}", exported, dir);
        return 0;
    }
};
