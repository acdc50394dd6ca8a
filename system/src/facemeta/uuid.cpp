#include "facemeta/uuid.hpp"
#include <cstring>
#include <random>

Uuid Uuid::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());

    Bytes b;
    uint64_t hi = gen();
    uint64_t lo = gen();
    for (int i = 0; i < 8; i++) {
        b[i] = static_cast<uint8_t>(hi >> (56 - i * 8));
        b[8 + i] = static_cast<uint8_t>(lo >> (56 - i * 8));
    }

    // version 4, variant RFC 4122
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);
    return Uuid(b);
}

std::optional<Uuid> Uuid::from_bytes(const void* data, size_t size) {
    if (data == nullptr || size != SIZE) return std::nullopt;
    Bytes b;
    std::memcpy(b.data(), data, SIZE);
    return Uuid(b);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Uuid> Uuid::from_hex(const std::string& hex) {
    std::string clean;
    clean.reserve(hex.size());
    for (char c : hex) {
        if (c != '-') clean += c;
    }
    if (clean.size() != SIZE * 2) return std::nullopt;

    Bytes b;
    for (size_t i = 0; i < SIZE; i++) {
        int h = hex_value(clean[i * 2]);
        int l = hex_value(clean[i * 2 + 1]);
        if (h < 0 || l < 0) return std::nullopt;
        b[i] = static_cast<uint8_t>((h << 4) | l);
    }
    return Uuid(b);
}

std::string Uuid::to_hex() const {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(SIZE * 2);
    for (auto v : bytes) {
        out += digits[v >> 4];
        out += digits[v & 0x0F];
    }
    return out;
}

bool Uuid::is_nil() const {
    for (auto v : bytes) {
        if (v != 0) return false;
    }
    return true;
}
