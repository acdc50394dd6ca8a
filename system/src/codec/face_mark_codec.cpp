#include "codec/face_mark_codec.hpp"
#include <cstring>

namespace {

const char MAGIC[4] = {'U', 'F', 'M', 'K'};

constexpr uint8_t FLAG_RECT = 0x01;
constexpr uint8_t FLAG_POSE = 0x02;

constexpr uint8_t DEPTH_U8 = 0;
constexpr uint8_t DEPTH_F32 = 1;

// ==================== WRITER ====================

class ByteWriter {
public:
    void put_u8(uint8_t v) { buf.push_back(v); }

    void put_u16(uint16_t v) {
        put_u8(static_cast<uint8_t>(v));
        put_u8(static_cast<uint8_t>(v >> 8));
    }

    void put_u32(uint32_t v) {
        for (int i = 0; i < 4; i++) put_u8(static_cast<uint8_t>(v >> (i * 8)));
    }

    void put_i32(int32_t v) { put_u32(static_cast<uint32_t>(v)); }

    void put_f32(float v) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        put_u32(bits);
    }

    void put_point(const cv::Point2f& p) {
        put_f32(p.x);
        put_f32(p.y);
    }

    void put_bytes(const void* data, size_t size) {
        const uint8_t* p = static_cast<const uint8_t*>(data);
        buf.insert(buf.end(), p, p + size);
    }

    std::vector<uint8_t> take() { return std::move(buf); }

private:
    std::vector<uint8_t> buf;
};

// ==================== READER ====================

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data(data), size(size), pos(0) {}

    uint8_t get_u8() {
        need(1);
        return data[pos++];
    }

    uint16_t get_u16() {
        uint16_t lo = get_u8();
        uint16_t hi = get_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }

    uint32_t get_u32() {
        uint32_t v = 0;
        for (int i = 0; i < 4; i++) v |= static_cast<uint32_t>(get_u8()) << (i * 8);
        return v;
    }

    int32_t get_i32() { return static_cast<int32_t>(get_u32()); }

    float get_f32() {
        uint32_t bits = get_u32();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    cv::Point2f get_point() {
        float x = get_f32();
        float y = get_f32();
        return {x, y};
    }

    const uint8_t* get_bytes(size_t n) {
        need(n);
        const uint8_t* p = data + pos;
        pos += n;
        return p;
    }

    size_t remaining() const { return size - pos; }

private:
    void need(size_t n) const {
        if (n > size - pos) {
            throw FaceMarkFormatError("truncated record at offset " + std::to_string(pos));
        }
    }

    const uint8_t* data;
    size_t size;
    size_t pos;
};

}  // namespace

namespace face_mark_codec {

std::vector<uint8_t> serialize(const UFaceMark& fm) {
    ByteWriter w;
    w.put_bytes(MAGIC, sizeof(MAGIC));
    w.put_u16(VERSION);

    uint8_t flags = 0;
    if (fm.rect) flags |= FLAG_RECT;
    if (fm.pose) flags |= FLAG_POSE;
    w.put_u8(flags);

    if (fm.rect) {
        for (const auto& p : fm.rect->pts) w.put_point(p);
    }

    w.put_u32(static_cast<uint32_t>(fm.landmarks.size()));
    for (const auto& lm : fm.landmarks) {
        w.put_u8(static_cast<uint8_t>(lm.type));
        w.put_u32(static_cast<uint32_t>(lm.points.size()));
        for (const auto& p : lm.points) w.put_point(p);
    }

    if (fm.pose) {
        w.put_f32(fm.pose->pitch);
        w.put_f32(fm.pose->yaw);
        w.put_f32(fm.pose->roll);
    }

    w.put_u32(static_cast<uint32_t>(fm.masks.size()));
    for (const auto& m : fm.masks) {
        uint8_t depth;
        if (m.mask.type() == CV_8UC1) {
            depth = DEPTH_U8;
        } else if (m.mask.type() == CV_32FC1) {
            depth = DEPTH_F32;
        } else {
            throw FaceMarkFormatError("mask must be CV_8UC1 or CV_32FC1");
        }
        // Con dims > 2 OpenCV deja rows/cols en -1
        if (m.mask.dims > 2) {
            throw FaceMarkFormatError("mask must be 2-dimensional, got " + std::to_string(m.mask.dims) + " dims");
        }

        cv::Mat cont = m.mask.isContinuous() ? m.mask : m.mask.clone();
        size_t len = cont.total() * cont.elemSize();

        w.put_u8(static_cast<uint8_t>(m.type));
        w.put_i32(cont.rows);
        w.put_i32(cont.cols);
        w.put_u8(depth);
        w.put_u32(static_cast<uint32_t>(len));
        if (depth == DEPTH_U8) {
            w.put_bytes(cont.data, len);
        } else {
            // f32 en little-endian explicito
            const float* f = cont.ptr<float>();
            for (size_t i = 0; i < cont.total(); i++) w.put_f32(f[i]);
        }
    }

    return w.take();
}

void deserialize(const uint8_t* data, size_t size, UFaceMark& out) {
    if (data == nullptr || size < sizeof(MAGIC)) {
        throw FaceMarkFormatError("record too short");
    }

    ByteReader r(data, size);
    if (std::memcmp(r.get_bytes(sizeof(MAGIC)), MAGIC, sizeof(MAGIC)) != 0) {
        throw FaceMarkFormatError("bad magic");
    }

    uint16_t version = r.get_u16();
    if (version != VERSION) {
        throw FaceMarkFormatError("unsupported version " + std::to_string(version));
    }

    uint8_t flags = r.get_u8();
    if (flags & ~(FLAG_RECT | FLAG_POSE)) {
        throw FaceMarkFormatError("unknown flags");
    }

    std::optional<FRect> rect;
    if (flags & FLAG_RECT) {
        FRect fr;
        for (auto& p : fr.pts) p = r.get_point();
        rect = fr;
    }

    std::vector<FLandmarks2D> landmarks;
    uint32_t n_lm = r.get_u32();
    for (uint32_t i = 0; i < n_lm; i++) {
        uint8_t type = r.get_u8();
        if (type > static_cast<uint8_t>(ELandmarks2D::L468)) {
            throw FaceMarkFormatError("unknown landmarks type " + std::to_string(type));
        }
        uint32_t n_pts = r.get_u32();
        if (n_pts > r.remaining() / 8) {
            throw FaceMarkFormatError("landmark count exceeds record size");
        }

        FLandmarks2D lm;
        lm.type = static_cast<ELandmarks2D>(type);
        lm.points.reserve(n_pts);
        for (uint32_t k = 0; k < n_pts; k++) lm.points.push_back(r.get_point());
        landmarks.push_back(std::move(lm));
    }

    std::optional<FPose> pose;
    if (flags & FLAG_POSE) {
        FPose p;
        p.pitch = r.get_f32();
        p.yaw = r.get_f32();
        p.roll = r.get_f32();
        pose = p;
    }

    std::vector<FMask> masks;
    uint32_t n_masks = r.get_u32();
    for (uint32_t i = 0; i < n_masks; i++) {
        uint8_t type = r.get_u8();
        if (type > static_cast<uint8_t>(EMaskType::FULL_FACE)) {
            throw FaceMarkFormatError("unknown mask type " + std::to_string(type));
        }
        int32_t rows = r.get_i32();
        int32_t cols = r.get_i32();
        uint8_t depth = r.get_u8();
        uint32_t len = r.get_u32();

        if (rows < 0 || cols < 0 || depth > DEPTH_F32) {
            throw FaceMarkFormatError("bad mask header");
        }
        size_t elem = depth == DEPTH_U8 ? 1 : 4;
        if (static_cast<uint64_t>(rows) * static_cast<uint64_t>(cols) * elem != len) {
            throw FaceMarkFormatError("mask size mismatch");
        }

        const uint8_t* bytes = r.get_bytes(len);
        FMask m;
        m.type = static_cast<EMaskType>(type);
        if (depth == DEPTH_U8) {
            m.mask = cv::Mat(rows, cols, CV_8UC1);
            if (len > 0) std::memcpy(m.mask.data, bytes, len);
        } else {
            m.mask = cv::Mat(rows, cols, CV_32FC1);
            ByteReader fr(bytes, len);
            float* f = m.mask.ptr<float>();
            for (size_t k = 0; k < static_cast<size_t>(rows) * cols; k++) f[k] = fr.get_f32();
        }
        masks.push_back(std::move(m));
    }

    if (r.remaining() != 0) {
        throw FaceMarkFormatError("trailing bytes after record");
    }

    out.rect = rect;
    out.landmarks = std::move(landmarks);
    out.pose = pose;
    out.masks = std::move(masks);
}

}  // namespace face_mark_codec
