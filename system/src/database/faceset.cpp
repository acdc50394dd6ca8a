#include "database/faceset.hpp"
#include "database/sqlite_tx.hpp"
#include "codec/face_mark_codec.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>

// ==================== HELPERS ====================

static std::string hex_of(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (auto v : bytes) {
        out += digits[v >> 4];
        out += digits[v & 0x0F];
    }
    return out.empty() ? "<null>" : out;
}

static Uuid uuid_column(const SqliteStatement& stmt, int col, const char* table) {
    auto bytes = stmt.column_blob(col);
    auto uuid = Uuid::from_bytes(bytes.data(), bytes.size());
    if (!uuid) {
        throw CorruptRecordError(table, hex_of(bytes), "uuid is not 16 bytes");
    }
    return *uuid;
}

static std::optional<Uuid> optional_uuid_column(const SqliteStatement& stmt, int col,
                                                const char* table, const Uuid& owner) {
    if (stmt.column_is_null(col)) return std::nullopt;
    auto bytes = stmt.column_blob(col);
    auto uuid = Uuid::from_bytes(bytes.data(), bytes.size());
    if (!uuid) {
        throw CorruptRecordError(table, owner.to_hex(), "reference uuid is not 16 bytes");
    }
    return uuid;
}

static void log_skipped(const char* table, const FacesetError& e) {
    spdlog::warn("Skipping unreadable {} row: {}", table, e.what());
}

// ==================== ITERATION SCOPE ====================

struct Faceset::IterationScope {
    std::atomic<std::thread::id>& owner;

    explicit IterationScope(std::atomic<std::thread::id>& owner) : owner(owner) {
        owner.store(std::this_thread::get_id());
    }
    ~IterationScope() { owner.store(std::thread::id()); }
};

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

Faceset::Faceset(const std::string& path, const FacesetConfig& config)
    : db(nullptr), path(path), config(config), iterating_thread(std::thread::id())
{
    std::filesystem::path p(path);
    if (p.extension().string() != SUFFIX) {
        spdlog::error("Invalid faceset path: {}", path);
        throw InvalidPathError(path);
    }

    if (config.create_dirs && p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw StorageIOError("Cannot create directory " + p.parent_path().string() +
                                 ": " + ec.message(), SQLITE_CANTOPEN);
        }
    }

    open_connection();

    try {
        spdlog::info("Faceset ready: {}", path);
        spdlog::info("   FaceMarks: {} | Persons: {} | Images: {}",
                     face_mark_count(), person_count(), image_count());
    } catch (const FacesetError&) {
        close_connection();
        throw;
    }
}

Faceset::~Faceset() {
    std::lock_guard<std::mutex> lock(db_mutex);
    close_connection();
}

// ==================== INITIALIZATION ====================

void Faceset::open_connection() {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        db = nullptr;
        spdlog::error("Cannot open faceset: {}", msg);
        throw StorageIOError("Cannot open faceset " + path + ": " + msg, rc);
    }

    try {
        sqlite3_busy_timeout(db, config.busy_timeout_ms);
        sqlite_exec(db, "PRAGMA journal_mode=" + config.journal_mode);

        SqliteTransaction tx(db);
        if (!table_exists("FacesetInfo")) {
            spdlog::info("FacesetInfo not found, initializing empty schema");
            reset_schema();
        }
        tx.commit();
    } catch (const FacesetError&) {
        close_connection();
        throw;
    }
}

void Faceset::close_connection() {
    if (!db) return;

    int rc = sqlite3_close_v2(db);
    if (rc != SQLITE_OK) {
        spdlog::error("Error closing faceset {}: {}", path, sqlite3_errstr(rc));
    }
    db = nullptr;
    spdlog::info("Faceset closed: {}", path);
}

bool Faceset::table_exists(const char* name) {
    SqliteStatement stmt(db, "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?");
    stmt.bind_text(1, name);
    return stmt.step() && stmt.column_int64(0) != 0;
}

void Faceset::reset_schema() {
    // Primero listar, despues borrar: no se puede hacer DROP con el SELECT abierto
    std::vector<std::pair<std::string, std::string>> objects;
    {
        // Solo el prefijo interno exacto: LIKE trata '_' como comodin e ignora mayusculas
        SqliteStatement stmt(db, "SELECT type, name FROM sqlite_master "
                                 "WHERE type IN ('table', 'view') AND substr(name, 1, 7) <> 'sqlite_'");
        while (stmt.step()) {
            objects.emplace_back(stmt.column_text(0), stmt.column_text(1));
        }
    }

    for (const auto& obj : objects) {
        std::string quoted;
        for (char c : obj.second) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        std::string kind = obj.first == "view" ? "VIEW" : "TABLE";
        sqlite_exec(db, "DROP " + kind + " \"" + quoted + "\"");
    }

    sqlite_exec(db, R"(
        CREATE TABLE FacesetInfo (version INT);
        INSERT INTO FacesetInfo VALUES ()" + std::to_string(VERSION) + R"();
        CREATE TABLE UImage (uuid BLOB, name TEXT, format TEXT, data BLOB);
        CREATE TABLE UPerson (uuid BLOB, name TEXT, age NUMERIC);
        CREATE TABLE UFaceMark (uuid BLOB, UImage_uuid BLOB, UPerson_uuid BLOB, pickled_bytes BLOB);
    )");

    spdlog::debug("Schema reset: dropped {} objects", objects.size());
}

// ==================== LOCKING ====================

void Faceset::check_not_reentrant() const {
    if (iterating_thread.load() == std::this_thread::get_id()) {
        throw FacesetError("Faceset cannot be used from inside an iteration callback");
    }
}

std::unique_lock<std::mutex> Faceset::acquire() {
    check_not_reentrant();
    std::unique_lock<std::mutex> lock(db_mutex);
    if (!db) {
        throw ClosedStoreError();
    }
    return lock;
}

// ==================== LIFECYCLE ====================

void Faceset::close() {
    check_not_reentrant();
    std::lock_guard<std::mutex> lock(db_mutex);
    close_connection();
}

bool Faceset::is_open() const {
    // Dentro de un iter_*() este thread ya tiene el lock y la conexion abierta
    if (iterating_thread.load() == std::this_thread::get_id()) return true;
    std::lock_guard<std::mutex> lock(db_mutex);
    return db != nullptr;
}

void Faceset::clear() {
    auto lock = acquire();

    SqliteTransaction tx(db);
    reset_schema();
    tx.commit();

    spdlog::info("Faceset cleared: {}", path);
}

void Faceset::compact() {
    auto lock = acquire();

    std::error_code before_ec, after_ec;
    auto before = std::filesystem::file_size(path, before_ec);

    sqlite_exec(db, "VACUUM");

    auto after = std::filesystem::file_size(path, after_ec);
    if (!before_ec && !after_ec) {
        spdlog::info("Faceset compacted: {:.2f} MB -> {:.2f} MB",
                     before / 1024.0 / 1024.0, after / 1024.0 / 1024.0);
    }
}

int Faceset::get_version() {
    auto lock = acquire();

    SqliteStatement stmt(db, "SELECT version FROM FacesetInfo LIMIT 1");
    if (!stmt.step()) {
        throw CorruptRecordError("FacesetInfo", "-", "missing version row");
    }
    return static_cast<int>(stmt.column_int64(0));
}

// ==================== SHARED CRUD ====================

int64_t Faceset::count_rows(const char* sql) {
    SqliteStatement stmt(db, sql);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

bool Faceset::row_exists(const char* sql, const Uuid& uuid) {
    SqliteStatement stmt(db, sql);
    stmt.bind_uuid(1, uuid);
    return stmt.step() && stmt.column_int64(0) != 0;
}

void Faceset::delete_all(const char* table) {
    auto lock = acquire();

    SqliteTransaction tx(db);
    sqlite_exec(db, std::string("DELETE FROM ") + table);
    int removed = sqlite3_changes(db);
    tx.commit();

    spdlog::info("Deleted all {} rows ({})", table, removed);
}

bool Faceset::delete_by_uuid(const char* table, const Uuid& uuid) {
    auto lock = acquire();

    std::string sql = std::string("DELETE FROM ") + table + " WHERE uuid=?";
    SqliteTransaction tx(db);
    {
        SqliteStatement stmt(db, sql.c_str());
        stmt.bind_uuid(1, uuid);
        stmt.run();
    }
    bool removed = sqlite3_changes(db) > 0;
    tx.commit();

    spdlog::debug("Delete {} {}: {}", table, uuid.to_hex(), removed ? "removed" : "not found");
    return removed;
}

// ==================== UFaceMark ====================

UFaceMark Faceset::face_mark_from_row(const SqliteStatement& stmt) const {
    UFaceMark fm(uuid_column(stmt, 0, "UFaceMark"));
    fm.image_uuid = optional_uuid_column(stmt, 1, "UFaceMark", fm.uuid);
    fm.person_uuid = optional_uuid_column(stmt, 2, "UFaceMark", fm.uuid);

    int size = 0;
    const void* blob = stmt.column_blob_ptr(3, size);
    try {
        face_mark_codec::deserialize(static_cast<const uint8_t*>(blob), static_cast<size_t>(size), fm);
    } catch (const FaceMarkFormatError& e) {
        throw CorruptRecordError("UFaceMark", fm.uuid.to_hex(), e.what());
    }
    return fm;
}

void Faceset::add_face_mark(const UFaceMark& fm) {
    std::vector<uint8_t> blob;
    try {
        blob = face_mark_codec::serialize(fm);
    } catch (const FaceMarkFormatError& e) {
        throw EncodeError("Unable to serialize UFaceMark " + fm.uuid.to_hex() + ": " + e.what());
    }

    auto lock = acquire();

    SqliteTransaction tx(db);
    bool exists = row_exists("SELECT COUNT(*) FROM UFaceMark WHERE uuid=?", fm.uuid);
    if (exists) {
        SqliteStatement stmt(db, "UPDATE UFaceMark SET UImage_uuid=?, UPerson_uuid=?, pickled_bytes=? WHERE uuid=?");
        stmt.bind_uuid(1, fm.image_uuid);
        stmt.bind_uuid(2, fm.person_uuid);
        stmt.bind_blob(3, blob.data(), blob.size());
        stmt.bind_uuid(4, fm.uuid);
        stmt.run();
    } else {
        SqliteStatement stmt(db, "INSERT INTO UFaceMark VALUES (?, ?, ?, ?)");
        stmt.bind_uuid(1, fm.uuid);
        stmt.bind_uuid(2, fm.image_uuid);
        stmt.bind_uuid(3, fm.person_uuid);
        stmt.bind_blob(4, blob.data(), blob.size());
        stmt.run();
    }
    tx.commit();

    spdlog::debug("{} UFaceMark {} ({} bytes)", exists ? "Updated" : "Added", fm.uuid.to_hex(), blob.size());
}

int64_t Faceset::face_mark_count() {
    auto lock = acquire();
    return count_rows("SELECT COUNT(*) FROM UFaceMark");
}

void Faceset::iter_face_marks(const Visitor<UFaceMark>& fn, ReadMode mode) {
    auto lock = acquire();

    SqliteStatement stmt(db, "SELECT uuid, UImage_uuid, UPerson_uuid, pickled_bytes FROM UFaceMark ORDER BY rowid");
    IterationScope scope(iterating_thread);

    while (stmt.step()) {
        std::optional<UFaceMark> fm;
        try {
            fm = face_mark_from_row(stmt);
        } catch (const CorruptRecordError& e) {
            if (mode == ReadMode::FAIL_FAST) throw;
            log_skipped("UFaceMark", e);
            continue;
        }
        if (!fn(*fm)) break;
    }
}

std::vector<UFaceMark> Faceset::get_all_face_marks(ReadMode mode) {
    std::vector<UFaceMark> result;
    iter_face_marks([&result](const UFaceMark& fm) {
        result.push_back(fm);
        return true;
    }, mode);
    return result;
}

std::optional<UFaceMark> Faceset::get_face_mark_by_uuid(const Uuid& uuid) {
    auto lock = acquire();

    SqliteStatement stmt(db, "SELECT uuid, UImage_uuid, UPerson_uuid, pickled_bytes FROM UFaceMark WHERE uuid=?");
    stmt.bind_uuid(1, uuid);
    if (!stmt.step()) return std::nullopt;
    return face_mark_from_row(stmt);
}

bool Faceset::delete_face_mark(const Uuid& uuid) {
    return delete_by_uuid("UFaceMark", uuid);
}

void Faceset::delete_all_face_marks() {
    delete_all("UFaceMark");
}

// ==================== UPerson ====================

UPerson Faceset::person_from_row(const SqliteStatement& stmt) const {
    UPerson person(uuid_column(stmt, 0, "UPerson"));
    person.name = stmt.column_text(1);
    if (stmt.column_is_null(2)) {
        person.age = std::nullopt;
    } else {
        person.age = stmt.column_double(2);
    }
    return person;
}

void Faceset::add_person(const UPerson& person) {
    auto lock = acquire();

    SqliteTransaction tx(db);
    bool exists = row_exists("SELECT COUNT(*) FROM UPerson WHERE uuid=?", person.uuid);
    if (exists) {
        SqliteStatement stmt(db, "UPDATE UPerson SET name=?, age=? WHERE uuid=?");
        stmt.bind_text(1, person.name);
        stmt.bind_double(2, person.age);
        stmt.bind_uuid(3, person.uuid);
        stmt.run();
    } else {
        SqliteStatement stmt(db, "INSERT INTO UPerson VALUES (?, ?, ?)");
        stmt.bind_uuid(1, person.uuid);
        stmt.bind_text(2, person.name);
        stmt.bind_double(3, person.age);
        stmt.run();
    }
    tx.commit();

    spdlog::debug("{} UPerson {} '{}'", exists ? "Updated" : "Added", person.uuid.to_hex(), person.name);
}

int64_t Faceset::person_count() {
    auto lock = acquire();
    return count_rows("SELECT COUNT(*) FROM UPerson");
}

void Faceset::iter_persons(const Visitor<UPerson>& fn) {
    auto lock = acquire();

    SqliteStatement stmt(db, "SELECT uuid, name, age FROM UPerson ORDER BY rowid");
    IterationScope scope(iterating_thread);

    while (stmt.step()) {
        if (!fn(person_from_row(stmt))) break;
    }
}

std::vector<UPerson> Faceset::get_all_persons() {
    std::vector<UPerson> result;
    iter_persons([&result](const UPerson& p) {
        result.push_back(p);
        return true;
    });
    return result;
}

std::optional<UPerson> Faceset::get_person_by_uuid(const Uuid& uuid) {
    auto lock = acquire();

    SqliteStatement stmt(db, "SELECT uuid, name, age FROM UPerson WHERE uuid=?");
    stmt.bind_uuid(1, uuid);
    if (!stmt.step()) return std::nullopt;
    return person_from_row(stmt);
}

bool Faceset::delete_person(const Uuid& uuid) {
    return delete_by_uuid("UPerson", uuid);
}

void Faceset::delete_all_persons() {
    delete_all("UPerson");
}

// ==================== UImage ====================

UImage Faceset::image_from_row(const SqliteStatement& stmt) const {
    UImage img(uuid_column(stmt, 0, "UImage"));
    img.name = stmt.column_text(1);

    std::string format = stmt.column_text(2);
    if (!image_codec::parse_format(format)) {
        throw DecodeError("UImage " + img.uuid.to_hex() + ": unknown format tag '" + format + "'");
    }

    int size = 0;
    const void* data = stmt.column_blob_ptr(3, size);
    try {
        img.image = image_codec::decode(static_cast<const uint8_t*>(data), static_cast<size_t>(size));
    } catch (const DecodeError& e) {
        throw DecodeError("UImage " + img.uuid.to_hex() + " (" + format + "): " + e.what());
    }
    return img;
}

void Faceset::add_image(const UImage& img) {
    add_image(img, config.default_format, config.default_quality);
}

void Faceset::add_image(const UImage& img, const std::string& format, int quality) {
    add_image(img, image_codec::format_from_string(format), quality);
}

void Faceset::add_image(const UImage& img, ImageFormat format, int quality) {
    // Validar y codificar antes de tocar la base de datos
    image_codec::validate_quality(format, quality, config.quality_check);
    auto bytes = image_codec::encode(img.image, format, quality);
    const char* format_tag = image_codec::format_name(format);

    auto lock = acquire();

    SqliteTransaction tx(db);
    bool exists = row_exists("SELECT COUNT(*) FROM UImage WHERE uuid=?", img.uuid);
    if (exists) {
        SqliteStatement stmt(db, "UPDATE UImage SET name=?, format=?, data=? WHERE uuid=?");
        stmt.bind_text(1, img.name);
        stmt.bind_text(2, format_tag);
        stmt.bind_blob(3, bytes.data(), bytes.size());
        stmt.bind_uuid(4, img.uuid);
        stmt.run();
    } else {
        SqliteStatement stmt(db, "INSERT INTO UImage VALUES (?, ?, ?, ?)");
        stmt.bind_uuid(1, img.uuid);
        stmt.bind_text(2, img.name);
        stmt.bind_text(3, format_tag);
        stmt.bind_blob(4, bytes.data(), bytes.size());
        stmt.run();
    }
    tx.commit();

    spdlog::debug("{} UImage {} '{}' as {} ({} bytes)",
                  exists ? "Updated" : "Added", img.uuid.to_hex(), img.name, format_tag, bytes.size());
}

int64_t Faceset::image_count() {
    auto lock = acquire();
    return count_rows("SELECT COUNT(*) FROM UImage");
}

std::optional<UImage> Faceset::get_image_by_uuid(const Uuid& uuid) {
    auto lock = acquire();

    SqliteStatement stmt(db, "SELECT uuid, name, format, data FROM UImage WHERE uuid=?");
    stmt.bind_uuid(1, uuid);
    if (!stmt.step()) return std::nullopt;
    return image_from_row(stmt);
}

void Faceset::iter_images(const Visitor<UImage>& fn, ReadMode mode) {
    auto lock = acquire();

    SqliteStatement stmt(db, "SELECT uuid, name, format, data FROM UImage ORDER BY rowid");
    IterationScope scope(iterating_thread);

    while (stmt.step()) {
        std::optional<UImage> img;
        try {
            img = image_from_row(stmt);
        } catch (const FacesetError& e) {
            // DecodeError o CorruptRecordError
            if (mode == ReadMode::FAIL_FAST) throw;
            log_skipped("UImage", e);
            continue;
        }
        if (!fn(*img)) break;
    }
}

std::vector<UImage> Faceset::get_all_images(ReadMode mode) {
    std::vector<UImage> result;
    iter_images([&result](const UImage& img) {
        result.push_back(img);
        return true;
    }, mode);
    return result;
}

void Faceset::delete_all_images() {
    delete_all("UImage");
}

// ==================== INTEGRITY ====================

std::vector<Faceset::DanglingRef> Faceset::check_integrity() {
    auto lock = acquire();

    const char* sql = R"(
        SELECT fm.uuid,
               CASE WHEN fm.UImage_uuid IS NOT NULL
                     AND NOT EXISTS (SELECT 1 FROM UImage i WHERE i.uuid = fm.UImage_uuid)
                    THEN fm.UImage_uuid END,
               CASE WHEN fm.UPerson_uuid IS NOT NULL
                     AND NOT EXISTS (SELECT 1 FROM UPerson p WHERE p.uuid = fm.UPerson_uuid)
                    THEN fm.UPerson_uuid END
        FROM UFaceMark fm
        ORDER BY fm.rowid
    )";

    std::vector<DanglingRef> result;
    SqliteStatement stmt(db, sql);
    while (stmt.step()) {
        if (stmt.column_is_null(1) && stmt.column_is_null(2)) continue;

        DanglingRef ref;
        ref.face_mark_uuid = uuid_column(stmt, 0, "UFaceMark");
        ref.missing_image_uuid = optional_uuid_column(stmt, 1, "UFaceMark", ref.face_mark_uuid);
        ref.missing_person_uuid = optional_uuid_column(stmt, 2, "UFaceMark", ref.face_mark_uuid);
        result.push_back(ref);
    }

    if (!result.empty()) {
        spdlog::warn("Integrity check: {} face marks with dangling references", result.size());
    }
    return result;
}
