// ============= include/facemeta/uuid.hpp =============
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

// Identificador de 128 bits (16 bytes crudos).
// Se guarda tal cual como BLOB en la base de datos.
class Uuid {
public:
    static constexpr size_t SIZE = 16;
    using Bytes = std::array<uint8_t, SIZE>;

    Uuid() : bytes{} {}
    explicit Uuid(const Bytes& b) : bytes(b) {}

    // UUID v4 aleatorio
    static Uuid generate();

    // nullopt si size != 16
    static std::optional<Uuid> from_bytes(const void* data, size_t size);

    // Acepta 32 caracteres hex (con o sin guiones)
    static std::optional<Uuid> from_hex(const std::string& hex);

    std::string to_hex() const;

    const Bytes& data() const { return bytes; }
    bool is_nil() const;

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
    bool operator<(const Uuid& other) const { return bytes < other.bytes; }

private:
    Bytes bytes;
};

namespace std {
template<>
struct hash<Uuid> {
    size_t operator()(const Uuid& u) const noexcept {
        size_t h = 1469598103934665603ull;
        for (auto b : u.data()) {
            h ^= b;
            h *= 1099511628211ull;
        }
        return h;
    }
};
}
