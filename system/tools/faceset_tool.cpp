// ============= tools/faceset_tool.cpp =============
/*
 * Herramienta de mantenimiento para archivos .dfs
 *
 * EJEMPLOS DE USO:
 *
 * ./faceset_tool dataset.dfs --stats
 * ./faceset_tool dataset.dfs --check
 * ./faceset_tool dataset.dfs --import-images ./aligned
 * ./faceset_tool dataset.dfs --export-images ./out
 * ./faceset_tool dataset.dfs --config configs/faceset.toml --compact
 */

#include "faceset_tool.hpp"
#include "simple_toml.hpp"
#include <iostream>
#include <string>

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " <faceset.dfs> [--config FILE.toml] <comando>\n\n";
    std::cout << "COMANDOS:\n";
    std::cout << "  --stats                 Mostrar conteos y tamaño\n";
    std::cout << "  --persons               Listar personas\n";
    std::cout << "  --check                 Buscar referencias colgantes\n";
    std::cout << "  --compact               VACUUM del archivo\n";
    std::cout << "  --clear                 Borrar todo el contenido\n";
    std::cout << "  --import-images DIR     Importar imagenes de un directorio\n";
    std::cout << "  --export-images DIR     Exportar imagenes como PNG\n";
    std::cout << "\nEJEMPLOS:\n";
    std::cout << "  " << prog << " dataset.dfs --stats\n";
    std::cout << "  " << prog << " dataset.dfs --import-images ./faces\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string path = argv[1];
    std::string config_file;
    std::string command;
    std::string command_arg;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        }
        else if ((arg == "--import-images" || arg == "--export-images") && i + 1 < argc) {
            command = arg;
            command_arg = argv[++i];
        }
        else if (arg == "--stats" || arg == "--persons" || arg == "--check" ||
                 arg == "--compact" || arg == "--clear") {
            command = arg;
        }
        else {
            std::cerr << "Opcion desconocida: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        SimpleToml toml;
        if (!config_file.empty() && !toml.load(config_file)) {
            std::cerr << "No se pudo cargar " << config_file << std::endl;
            return 1;
        }
        LogConfig::from_toml(toml).apply();
        FacesetConfig config = FacesetConfig::from_toml(toml);

        Faceset faceset(path, config);
        FacesetTool tool(faceset);

        int rc = 0;
        if (command == "--stats") {
            tool.show_statistics();
        }
        else if (command == "--persons") {
            tool.show_persons();
        }
        else if (command == "--check") {
            rc = tool.check();
        }
        else if (command == "--compact") {
            faceset.compact();
        }
        else if (command == "--clear") {
            faceset.clear();
        }
        else if (command == "--import-images") {
            rc = tool.import_images(command_arg);
        }
        else if (command == "--export-images") {
            rc = tool.export_images(command_arg);
        }

        faceset.close();
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
