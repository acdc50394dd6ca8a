// ============= include/facemeta/uimage.hpp =============
#pragma once
#include "facemeta/uuid.hpp"
#include <opencv2/core.hpp>
#include <string>

// Imagen en memoria (HxWxC, profundidad segun el codec)
struct UImage {
    Uuid uuid;
    std::string name;
    cv::Mat image;

    UImage() : uuid(Uuid::generate()) {}
    explicit UImage(const Uuid& uuid) : uuid(uuid) {}
};
