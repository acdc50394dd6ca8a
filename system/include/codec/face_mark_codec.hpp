// ============= include/codec/face_mark_codec.hpp =============
/*
 * Serializacion binaria de la geometria de UFaceMark
 *
 * FORMATO v1 (little-endian):
 * ├── "UFMK"            magic (4 bytes)
 * ├── u16 version       = 1
 * ├── u8  flags         bit0 = rect, bit1 = pose
 * ├── [rect]            8 x f32
 * ├── u32 n_landmarks   por cada uno: u8 type, u32 n, n x (f32 x, f32 y)
 * ├── [pose]            3 x f32 (pitch, yaw, roll)
 * └── u32 n_masks       por cada una: u8 type, i32 rows, i32 cols,
 *                       u8 depth (0 = u8, 1 = f32), u32 len, bytes
 *
 * uuid, image_uuid y person_uuid NO van en el blob: son columnas propias.
 */

#pragma once
#include "facemeta/face_mark.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class FaceMarkFormatError : public std::runtime_error {
public:
    explicit FaceMarkFormatError(const std::string& msg) : std::runtime_error(msg) {}
};

namespace face_mark_codec {

constexpr uint16_t VERSION = 1;

// Lanza FaceMarkFormatError si una mascara no es CV_8UC1 / CV_32FC1
std::vector<uint8_t> serialize(const UFaceMark& fm);

// Rellena la geometria de `out` (no toca uuids). Lanza FaceMarkFormatError
void deserialize(const uint8_t* data, size_t size, UFaceMark& out);

}  // namespace face_mark_codec
