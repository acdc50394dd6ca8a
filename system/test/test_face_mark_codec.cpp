// ============= test/test_face_mark_codec.cpp =============
//
// Registro binario de UFaceMark
//
// USO:
//   ./test_face_mark_codec
//

#include "codec/face_mark_codec.hpp"
#include "test_common.hpp"
#include <opencv2/core.hpp>

static UFaceMark make_full_face_mark() {
    UFaceMark fm;
    fm.rect = FRect::from_ltrb(0.1f, 0.2f, 0.7f, 0.9f);

    FLandmarks2D l5;
    l5.type = ELandmarks2D::L5;
    l5.points = {{0.3f, 0.4f}, {0.6f, 0.4f}, {0.45f, 0.55f}, {0.35f, 0.7f}, {0.55f, 0.7f}};
    fm.landmarks.push_back(l5);

    FLandmarks2D l68;
    l68.type = ELandmarks2D::L68;
    for (int i = 0; i < 68; i++) {
        l68.points.emplace_back(i / 68.0f, 1.0f - i / 68.0f);
    }
    fm.landmarks.push_back(l68);

    FPose pose;
    pose.pitch = 0.1f;
    pose.yaw = -0.25f;
    pose.roll = 1.5f;
    fm.pose = pose;

    FMask m8;
    m8.type = EMaskType::FULL_FACE;
    m8.mask = cv::Mat(4, 5, CV_8UC1);
    cv::randu(m8.mask, 0, 256);
    fm.masks.push_back(m8);

    FMask m32;
    m32.type = EMaskType::UNDEFINED;
    m32.mask = cv::Mat(3, 2, CV_32FC1);
    cv::randu(m32.mask, 0.0f, 1.0f);
    fm.masks.push_back(m32);

    return fm;
}

static bool same_mat(const cv::Mat& a, const cv::Mat& b) {
    if (a.size() != b.size() || a.type() != b.type()) return false;
    if (a.empty()) return true;
    return cv::norm(a, b, cv::NORM_INF) == 0.0;
}

static void test_full_record() {
    UFaceMark src = make_full_face_mark();
    auto bytes = face_mark_codec::serialize(src);

    UFaceMark dst;
    face_mark_codec::deserialize(bytes.data(), bytes.size(), dst);

    CHECK(dst.rect.has_value());
    CHECK(dst.rect && *dst.rect == *src.rect);
    CHECK(dst.landmarks.size() == 2);
    CHECK(dst.landmarks == src.landmarks);
    CHECK(dst.pose && *dst.pose == *src.pose);
    CHECK(dst.get_landmarks(ELandmarks2D::L68) != nullptr);
    CHECK(dst.get_landmarks(ELandmarks2D::L468) == nullptr);

    CHECK(dst.masks.size() == 2);
    if (dst.masks.size() == 2) {
        CHECK(dst.masks[0].type == EMaskType::FULL_FACE);
        CHECK(same_mat(dst.masks[0].mask, src.masks[0].mask));
        CHECK(dst.masks[1].type == EMaskType::UNDEFINED);
        CHECK(same_mat(dst.masks[1].mask, src.masks[1].mask));
    }
}

static void test_empty_geometry() {
    UFaceMark src;
    auto bytes = face_mark_codec::serialize(src);

    // magic + version + flags + 2 contadores vacios
    CHECK(bytes.size() == 4 + 2 + 1 + 4 + 4);

    UFaceMark dst = make_full_face_mark();
    face_mark_codec::deserialize(bytes.data(), bytes.size(), dst);
    CHECK(!dst.rect);
    CHECK(!dst.pose);
    CHECK(dst.landmarks.empty());
    CHECK(dst.masks.empty());
}

static void test_header_layout() {
    UFaceMark fm;
    fm.pose = FPose();
    auto bytes = face_mark_codec::serialize(fm);

    CHECK(bytes.size() > 7);
    CHECK(bytes[0] == 'U' && bytes[1] == 'F' && bytes[2] == 'M' && bytes[3] == 'K');
    CHECK(bytes[4] == 0x01 && bytes[5] == 0x00);  // version 1, little-endian
    CHECK(bytes[6] == 0x02);                      // solo pose
}

static void test_deserialize_keeps_identity() {
    Uuid id = Uuid::generate();
    UFaceMark src(id);
    CHECK(src.uuid == id);
    src.rect = FRect::from_ltrb(0.0f, 0.0f, 1.0f, 1.0f);

    auto bytes = face_mark_codec::serialize(src);
    UFaceMark dst(id);
    face_mark_codec::deserialize(bytes.data(), bytes.size(), dst);
    CHECK(dst.uuid == id);
    CHECK(dst.rect && *dst.rect == *src.rect);
}

static void test_rejects_bad_records() {
    UFaceMark src = make_full_face_mark();
    auto good = face_mark_codec::serialize(src);
    UFaceMark out;

    auto bad_magic = good;
    bad_magic[0] = 'X';
    CHECK_THROWS(face_mark_codec::deserialize(bad_magic.data(), bad_magic.size(), out), FaceMarkFormatError);

    auto bad_version = good;
    bad_version[4] = 0x02;
    CHECK_THROWS(face_mark_codec::deserialize(bad_version.data(), bad_version.size(), out), FaceMarkFormatError);

    auto truncated = good;
    truncated.resize(good.size() - 3);
    CHECK_THROWS(face_mark_codec::deserialize(truncated.data(), truncated.size(), out), FaceMarkFormatError);

    auto trailing = good;
    trailing.push_back(0);
    CHECK_THROWS(face_mark_codec::deserialize(trailing.data(), trailing.size(), out), FaceMarkFormatError);

    auto bad_flags = good;
    bad_flags[6] = 0x80;
    CHECK_THROWS(face_mark_codec::deserialize(bad_flags.data(), bad_flags.size(), out), FaceMarkFormatError);

    CHECK_THROWS(face_mark_codec::deserialize(nullptr, 0, out), FaceMarkFormatError);

    // Un fallo no modifica el destino
    UFaceMark kept = make_full_face_mark();
    try {
        face_mark_codec::deserialize(truncated.data(), truncated.size(), kept);
    } catch (const FaceMarkFormatError&) {
    }
    CHECK(kept.landmarks.size() == 2);
}

static void test_unknown_landmark_type() {
    UFaceMark src;
    FLandmarks2D lm;
    lm.type = ELandmarks2D::L5;
    lm.points = {{0.5f, 0.5f}};
    src.landmarks.push_back(lm);

    auto bytes = face_mark_codec::serialize(src);
    // magic(4) version(2) flags(1) count(4) -> byte 11 es el tipo
    bytes[11] = 9;

    UFaceMark out;
    CHECK_THROWS(face_mark_codec::deserialize(bytes.data(), bytes.size(), out), FaceMarkFormatError);
}

static void test_rejects_multichannel_mask() {
    UFaceMark fm;
    FMask m;
    m.mask = cv::Mat::zeros(2, 2, CV_8UC3);
    fm.masks.push_back(m);
    CHECK_THROWS(face_mark_codec::serialize(fm), FaceMarkFormatError);
}

static void test_rejects_nd_mask() {
    int sizes[] = {2, 2, 2};
    UFaceMark fm;
    FMask m;
    m.mask = cv::Mat(3, sizes, CV_8UC1, cv::Scalar(1));
    fm.masks.push_back(m);
    CHECK_THROWS(face_mark_codec::serialize(fm), FaceMarkFormatError);

    // Mascara vacia sigue siendo valida
    UFaceMark empty_mask;
    empty_mask.masks.push_back(FMask());
    auto bytes = face_mark_codec::serialize(empty_mask);
    UFaceMark out;
    face_mark_codec::deserialize(bytes.data(), bytes.size(), out);
    CHECK(out.masks.size() == 1 && out.masks[0].mask.empty());
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] %v");
    spdlog::info("Face mark codec tests");

    test::run("full record", test_full_record);
    test::run("empty geometry", test_empty_geometry);
    test::run("header layout", test_header_layout);
    test::run("deserialize keeps identity", test_deserialize_keeps_identity);
    test::run("rejects bad records", test_rejects_bad_records);
    test::run("unknown landmark type", test_unknown_landmark_type);
    test::run("rejects multichannel mask", test_rejects_multichannel_mask);
    test::run("rejects n-dimensional mask", test_rejects_nd_mask);

    return test::summary("test_face_mark_codec");
}
