#include "codec/image_codec.hpp"
#include "database/faceset_errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

namespace image_codec {

std::optional<ImageFormat> parse_format(const std::string& name) {
    if (name == "webp") return ImageFormat::WEBP;
    if (name == "png")  return ImageFormat::PNG;
    if (name == "jpg")  return ImageFormat::JPG;
    if (name == "jp2")  return ImageFormat::JP2;
    return std::nullopt;
}

ImageFormat format_from_string(const std::string& name) {
    auto format = parse_format(name);
    if (!format) {
        throw UnsupportedFormatError(name);
    }
    return *format;
}

const char* format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::WEBP: return "webp";
        case ImageFormat::PNG:  return "png";
        case ImageFormat::JPG:  return "jpg";
        case ImageFormat::JP2:  return "jp2";
    }
    return "unknown";
}

bool is_lossless(ImageFormat format) {
    return format == ImageFormat::PNG;
}

void validate_quality(ImageFormat format, int quality, QualityCheck check) {
    if (check == QualityCheck::STRICT) {
        if (quality < 0 || quality > 100) {
            throw InvalidQualityError(quality);
        }
        return;
    }

    // Compatibilidad: (jpg/jp2 and q < 0) or q > 100
    bool jpeg_family = format == ImageFormat::JPG || format == ImageFormat::JP2;
    if ((jpeg_family && quality < 0) || quality > 100) {
        throw InvalidQualityError(quality);
    }
    if (quality < 0) {
        spdlog::warn("Legacy quality check: accepting quality {} for {}", quality, format_name(format));
    }
}

static std::vector<int> encode_params(ImageFormat format, int quality) {
    switch (format) {
        case ImageFormat::WEBP: return {cv::IMWRITE_WEBP_QUALITY, quality};
        case ImageFormat::JPG:  return {cv::IMWRITE_JPEG_QUALITY, quality};
        case ImageFormat::JP2:  return {cv::IMWRITE_JPEG2000_COMPRESSION_X1000, quality * 10};
        case ImageFormat::PNG:  return {};
    }
    return {};
}

std::vector<uint8_t> encode(const cv::Mat& image, ImageFormat format, int quality) {
    if (image.empty()) {
        throw EncodeError(std::string("Unable to encode empty image as ") + format_name(format));
    }

    std::string ext = std::string(".") + format_name(format);
    std::vector<uint8_t> bytes;
    bool ok = false;

    try {
        ok = cv::imencode(ext, image, bytes, encode_params(format, quality));
    } catch (const cv::Exception& e) {
        throw EncodeError(std::string("Unable to encode image format ") + format_name(format) +
                          ": " + e.what());
    }

    if (!ok || bytes.empty()) {
        throw EncodeError(std::string("Unable to encode image format ") + format_name(format));
    }

    spdlog::debug("Encoded {}x{}x{} as {} (q={}): {} bytes",
                  image.rows, image.cols, image.channels(), format_name(format), quality, bytes.size());
    return bytes;
}

cv::Mat decode(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw DecodeError("Unable to decode image: empty buffer");
    }

    cv::Mat img;
    try {
        cv::Mat raw(1, static_cast<int>(size), CV_8UC1, const_cast<uint8_t*>(data));
        img = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("Unable to decode image: ") + e.what());
    }

    if (img.empty()) {
        throw DecodeError("Unable to decode image: invalid data");
    }
    return img;
}

}  // namespace image_codec
