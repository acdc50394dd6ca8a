// ============= include/database/faceset.hpp =============
/*
 * Faceset - almacen de datos de rostros (.dfs)
 *
 * CARACTERISTICAS:
 * - Un unico archivo SQLite portable
 * - Tres entidades: UFaceMark, UPerson, UImage (clave = uuid de 16 bytes)
 * - Upsert transaccional (BEGIN IMMEDIATE), todo-o-nada
 * - Imagenes re-codificadas (webp/png/jpg/jp2) con OpenCV
 * - Geometria de UFaceMark en un registro binario versionado
 *
 * TABLAS:
 * ├── FacesetInfo (version INT)                  -- una fila, version = 1
 * ├── UImage      (uuid, name, format, data)
 * ├── UPerson     (uuid, name, age)
 * └── UFaceMark   (uuid, UImage_uuid, UPerson_uuid, pickled_bytes)
 *
 * CONCURRENCIA:
 * - Todas las llamadas publicas toman un mutex interno: una instancia
 *   se puede compartir entre threads.
 * - Entre procesos solo hay el lock de archivo de SQLite (busy_timeout).
 * - Los callbacks de iter_*() NO pueden volver a llamar al Faceset.
 *
 * REFERENCIAS:
 * - UFaceMark.image_uuid / person_uuid son debiles: no se validan ni se
 *   borran en cascada. check_integrity() lista las que no resuelven.
 */

#pragma once
#include "codec/image_codec.hpp"
#include "database/faceset_config.hpp"
#include "database/faceset_errors.hpp"
#include "facemeta/face_mark.hpp"
#include "facemeta/uimage.hpp"
#include "facemeta/uperson.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct sqlite3;
class SqliteStatement;

class Faceset {
public:
    static constexpr const char* SUFFIX = ".dfs";
    static constexpr int VERSION = 1;

    // Que hacer con filas que no se pueden decodificar en lecturas masivas
    enum class ReadMode {
        FAIL_FAST,    // lanza en la primera fila mala
        SKIP_CORRUPT  // loguea warning y sigue
    };

    // Referencia de un UFaceMark que no existe en su tabla
    struct DanglingRef {
        Uuid face_mark_uuid;
        std::optional<Uuid> missing_image_uuid;
        std::optional<Uuid> missing_person_uuid;
    };

    template<typename T>
    using Visitor = std::function<bool(const T&)>;  // false -> parar

    // Lanza InvalidPathError (sin crear el archivo) o StorageIOError
    explicit Faceset(const std::string& path, const FacesetConfig& config = FacesetConfig());
    ~Faceset();

    Faceset(const Faceset&) = delete;
    Faceset& operator=(const Faceset&) = delete;

    // ===== LIFECYCLE =====

    void close();
    bool is_open() const;
    const std::string& get_path() const { return path; }
    const FacesetConfig& get_config() const { return config; }

    // Borra todo y recrea el esquema vacio (transaccional)
    void clear();

    // VACUUM
    void compact();

    int get_version();

    // ===== UFaceMark =====

    void add_face_mark(const UFaceMark& fm);
    int64_t face_mark_count();
    std::vector<UFaceMark> get_all_face_marks(ReadMode mode = ReadMode::FAIL_FAST);
    void iter_face_marks(const Visitor<UFaceMark>& fn, ReadMode mode = ReadMode::FAIL_FAST);
    std::optional<UFaceMark> get_face_mark_by_uuid(const Uuid& uuid);
    bool delete_face_mark(const Uuid& uuid);
    void delete_all_face_marks();

    // ===== UPerson =====

    void add_person(const UPerson& person);
    int64_t person_count();
    std::vector<UPerson> get_all_persons();
    void iter_persons(const Visitor<UPerson>& fn);
    std::optional<UPerson> get_person_by_uuid(const Uuid& uuid);
    bool delete_person(const Uuid& uuid);
    void delete_all_persons();

    // ===== UImage =====

    // Formato y calidad por defecto de la configuracion
    void add_image(const UImage& img);
    void add_image(const UImage& img, ImageFormat format, int quality = 100);
    // Lanza UnsupportedFormatError si format no es webp/png/jpg/jp2
    void add_image(const UImage& img, const std::string& format, int quality = 100);

    int64_t image_count();
    std::optional<UImage> get_image_by_uuid(const Uuid& uuid);
    std::vector<UImage> get_all_images(ReadMode mode = ReadMode::FAIL_FAST);
    void iter_images(const Visitor<UImage>& fn, ReadMode mode = ReadMode::FAIL_FAST);
    void delete_all_images();

    // ===== MANTENIMIENTO =====

    std::vector<DanglingRef> check_integrity();

private:
    sqlite3* db;
    std::string path;
    FacesetConfig config;

    mutable std::mutex db_mutex;
    std::atomic<std::thread::id> iterating_thread;

    // Lock + comprobaciones (cerrado / llamada desde un callback)
    std::unique_lock<std::mutex> acquire();
    void check_not_reentrant() const;

    void open_connection();
    void close_connection();
    bool table_exists(const char* name);
    void reset_schema();  // requiere transaccion abierta
    int64_t count_rows(const char* sql);
    bool row_exists(const char* sql, const Uuid& uuid);
    void delete_all(const char* table);
    bool delete_by_uuid(const char* table, const Uuid& uuid);

    UFaceMark face_mark_from_row(const SqliteStatement& stmt) const;
    UPerson person_from_row(const SqliteStatement& stmt) const;
    UImage image_from_row(const SqliteStatement& stmt) const;

    // Marca el thread que esta dentro de un iter_*()
    struct IterationScope;
};
