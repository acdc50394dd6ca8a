// ============= include/facemeta/face_mark.hpp =============
/*
 * UFaceMark - anotacion de un rostro detectado
 *
 * CONTENIDO:
 * - uuid propio
 * - referencia (opcional) a la imagen y a la persona
 * - geometria: rect, landmarks, pose, mascaras
 *
 * Las referencias son debiles: no se valida que la imagen o la
 * persona existan en el faceset.
 */

#pragma once
#include "facemeta/uuid.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

// Cuatro esquinas del rostro en coordenadas normalizadas [0..1]
struct FRect {
    cv::Point2f pts[4];

    static FRect from_ltrb(float l, float t, float r, float b) {
        FRect rect;
        rect.pts[0] = {l, t};
        rect.pts[1] = {l, b};
        rect.pts[2] = {r, b};
        rect.pts[3] = {r, t};
        return rect;
    }

    bool operator==(const FRect& other) const {
        for (int i = 0; i < 4; i++) {
            if (pts[i] != other.pts[i]) return false;
        }
        return true;
    }
};

enum class ELandmarks2D : uint8_t {
    L5 = 0,
    L68 = 1,
    L468 = 2
};

struct FLandmarks2D {
    ELandmarks2D type = ELandmarks2D::L68;
    std::vector<cv::Point2f> points;  // normalizados

    bool operator==(const FLandmarks2D& other) const {
        return type == other.type && points == other.points;
    }
};

// Angulos en radianes
struct FPose {
    float pitch = 0.0f;
    float yaw = 0.0f;
    float roll = 0.0f;

    bool operator==(const FPose& other) const {
        return pitch == other.pitch && yaw == other.yaw && roll == other.roll;
    }
};

enum class EMaskType : uint8_t {
    UNDEFINED = 0,
    FULL_FACE = 1
};

// Mascara de un canal: CV_8UC1 o CV_32FC1
struct FMask {
    EMaskType type = EMaskType::UNDEFINED;
    cv::Mat mask;
};

struct UFaceMark {
    Uuid uuid;
    std::optional<Uuid> image_uuid;
    std::optional<Uuid> person_uuid;

    std::optional<FRect> rect;
    std::vector<FLandmarks2D> landmarks;
    std::optional<FPose> pose;
    std::vector<FMask> masks;

    UFaceMark() : uuid(Uuid::generate()) {}
    explicit UFaceMark(const Uuid& uuid) : uuid(uuid) {}

    const FLandmarks2D* get_landmarks(ELandmarks2D type) const {
        for (const auto& lm : landmarks) {
            if (lm.type == type) return &lm;
        }
        return nullptr;
    }
};
