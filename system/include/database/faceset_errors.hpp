// ============= include/database/faceset_errors.hpp =============
#pragma once
#include <stdexcept>
#include <string>

class FacesetError : public std::runtime_error {
public:
    explicit FacesetError(const std::string& msg) : std::runtime_error(msg) {}
};

// Extension distinta de .dfs
class InvalidPathError : public FacesetError {
public:
    explicit InvalidPathError(const std::string& path)
        : FacesetError("Path must be a .dfs file: " + path), path(path) {}

    const std::string path;
};

class ClosedStoreError : public FacesetError {
public:
    ClosedStoreError() : FacesetError("Faceset is closed") {}
};

class UnsupportedFormatError : public FacesetError {
public:
    explicit UnsupportedFormatError(const std::string& format)
        : FacesetError("Image format '" + format + "' is unsupported"), format(format) {}

    const std::string format;
};

class InvalidQualityError : public FacesetError {
public:
    explicit InvalidQualityError(int quality)
        : FacesetError("Quality must be in range [0..100], got " + std::to_string(quality)),
          quality(quality) {}

    const int quality;
};

class EncodeError : public FacesetError {
public:
    explicit EncodeError(const std::string& msg) : FacesetError(msg) {}
};

class DecodeError : public FacesetError {
public:
    explicit DecodeError(const std::string& msg) : FacesetError(msg) {}
};

// Blob de UFaceMark (u otra fila) que no se puede interpretar
class CorruptRecordError : public FacesetError {
public:
    CorruptRecordError(const std::string& table, const std::string& uuid_hex, const std::string& reason)
        : FacesetError("Corrupt " + table + " record " + uuid_hex + ": " + reason),
          table(table), uuid_hex(uuid_hex) {}

    const std::string table;
    const std::string uuid_hex;
};

// Fallo de SQLite (I/O, lock timeout, constraint...)
class StorageIOError : public FacesetError {
public:
    StorageIOError(const std::string& msg, int sqlite_code)
        : FacesetError(msg), sqlite_code(sqlite_code) {}

    const int sqlite_code;
};
