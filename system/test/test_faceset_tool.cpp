// ============= test/test_faceset_tool.cpp =============
//
// Comandos de faceset_tool sobre un store temporal
//
// USO:
//   ./test_faceset_tool
//

#include "faceset_tool.hpp"
#include "test_common.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <fstream>

static FacesetConfig png_config() {
    FacesetConfig cfg;
    cfg.default_format = ImageFormat::PNG;
    return cfg;
}

static UImage make_image(const std::string& name) {
    UImage img;
    img.name = name;
    img.image = cv::Mat(16, 16, CV_8UC3);
    cv::randu(img.image, 0, 256);
    return img;
}

static int count_files(const std::string& dir) {
    int n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) n++;
    }
    return n;
}

static void test_export_name_collision() {
    test::TempDir tmp;
    Faceset store(tmp.file("export.dfs"), png_config());
    UImage jpg = make_image("a.jpg");
    UImage png = make_image("a.png");
    store.add_image(jpg);
    store.add_image(png);

    FacesetTool tool(store);
    std::string out = tmp.file("out");
    CHECK(tool.export_images(out) == 0);

    CHECK(count_files(out) == 2);
    CHECK(std::filesystem::exists(std::filesystem::path(out) / "a.png"));
    CHECK(std::filesystem::exists(std::filesystem::path(out) / ("a_" + png.uuid.to_hex() + ".png")));

    // El primero no se sobrescribe
    cv::Mat first = cv::imread((std::filesystem::path(out) / "a.png").string(), cv::IMREAD_UNCHANGED);
    CHECK(!first.empty() && cv::norm(first, jpg.image, cv::NORM_INF) == 0.0);
}

static void test_import_uppercase_extension() {
    test::TempDir tmp;
    std::string in = tmp.file("in");
    std::filesystem::create_directories(in);

    cv::Mat img(8, 8, CV_8UC3, cv::Scalar(10, 20, 30));
    std::string lower = (std::filesystem::path(in) / "face.png").string();
    CHECK(cv::imwrite(lower, img));
    std::filesystem::rename(lower, std::filesystem::path(in) / "FACE.PNG");
    {
        std::ofstream notes((std::filesystem::path(in) / "notes.txt").string());
        notes << "not an image";
    }

    Faceset store(tmp.file("import.dfs"), png_config());
    FacesetTool tool(store);
    CHECK(tool.import_images(in) == 0);
    CHECK(store.image_count() == 1);

    auto all = store.get_all_images();
    CHECK(all.size() == 1 && all[0].name == "FACE.PNG");
}

static void test_check_exit_code() {
    test::TempDir tmp;
    Faceset store(tmp.file("check.dfs"));
    FacesetTool tool(store);

    store.add_face_mark(UFaceMark());
    CHECK(tool.check() == 0);

    UFaceMark dangling;
    dangling.person_uuid = Uuid::generate();
    store.add_face_mark(dangling);
    CHECK(tool.check() == 2);
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] %v");
    spdlog::info("Faceset tool tests");

    test::run("export name collision", test_export_name_collision);
    test::run("import uppercase extension", test_import_uppercase_extension);
    test::run("check exit code", test_check_exit_code);

    return test::summary("test_faceset_tool");
}
