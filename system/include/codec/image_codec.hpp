// ============= include/codec/image_codec.hpp =============
/*
 * Image Codec - codificacion de UImage para el faceset
 *
 * FORMATOS:
 * - webp  (quality 0-100; OpenCV no hace lossless con 100)
 * - png   (lossless, ignora quality)
 * - jpg   (quality 0-100)
 * - jp2   (JPEG 2000, compression x1000 = quality * 10)
 */

#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class ImageFormat {
    WEBP,
    PNG,
    JPG,
    JP2
};

// Como se valida quality en encode
enum class QualityCheck {
    STRICT,  // [0..100] para todos los formatos
    LEGACY   // comportamiento historico: quality < 0 solo se rechaza en jpg/jp2
};

namespace image_codec {

// "webp" -> WEBP, ...; nullopt si no es soportado
std::optional<ImageFormat> parse_format(const std::string& name);

// Igual que parse_format pero lanza UnsupportedFormatError
ImageFormat format_from_string(const std::string& name);

const char* format_name(ImageFormat format);

bool is_lossless(ImageFormat format);

// Lanza InvalidQualityError
void validate_quality(ImageFormat format, int quality, QualityCheck check = QualityCheck::STRICT);

// Lanza EncodeError si OpenCV rechaza la imagen
std::vector<uint8_t> encode(const cv::Mat& image, ImageFormat format, int quality);

// IMREAD_UNCHANGED. Lanza DecodeError si los bytes no son validos
cv::Mat decode(const uint8_t* data, size_t size);

inline cv::Mat decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

}  // namespace image_codec
