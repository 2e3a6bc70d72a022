#include "image_prep.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

constexpr double LINK_BYTES_PER_SECOND = 250.0;   // ~2.4 kbps air rate after overhead

static const ImagePreset PRESETS[] = {
    {"thumbnail", 160, 120, 60},
    {"small", 320, 240, 70},
    {"medium", 640, 480, 75},
    {"large", 800, 600, 80},
};

const ImagePreset& find_preset(const std::string& name) {
    for (const ImagePreset& preset : PRESETS) {
        if (name == preset.name) return preset;
    }
    throw std::invalid_argument("unknown image preset '" + name +
                                "' (thumbnail, small, medium, large)");
}

cv::Size fit_within(const cv::Size& size, const ImagePreset& preset) {
    if (size.width <= preset.max_width && size.height <= preset.max_height) {
        return size;
    }

    double scale = std::min(static_cast<double>(preset.max_width) / size.width,
                            static_cast<double>(preset.max_height) / size.height);
    return cv::Size(std::max(1, cvRound(size.width * scale)),
                    std::max(1, cvRound(size.height * scale)));
}

cv::Mat to_bgr(const cv::Mat& image) {
    cv::Mat src = image;
    if (image.depth() == CV_16U) {
        image.convertTo(src, CV_MAKETYPE(CV_8U, image.channels()), 1.0 / 256.0);
    }

    cv::Mat bgr;

    switch (src.channels()) {
    case 1:
        cv::cvtColor(src, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 4: {
        std::vector<cv::Mat> planes;
        cv::split(src, planes);

        cv::Mat alpha;
        planes[3].convertTo(alpha, CV_32F, 1.0 / 255.0);
        cv::Mat alpha3;
        cv::merge(std::vector<cv::Mat>{alpha, alpha, alpha}, alpha3);

        cv::Mat color;
        cv::merge(std::vector<cv::Mat>{planes[0], planes[1], planes[2]}, color);
        color.convertTo(color, CV_32FC3);

        cv::Mat transparency;
        cv::subtract(cv::Scalar::all(1.0), alpha3, transparency);

        // composite over white
        cv::Mat white(color.size(), CV_32FC3, cv::Scalar::all(255.0));
        cv::Mat blended = color.mul(alpha3) + white.mul(transparency);
        blended.convertTo(bgr, CV_8UC3);
        break;
    }
    default:
        bgr = src;
        break;
    }

    return bgr;
}

std::vector<uint8_t> optimize_image(const cv::Mat& image, const std::string& preset_name) {
    const ImagePreset& preset = find_preset(preset_name);
    if (image.empty()) throw std::runtime_error("[image_prep] empty image");

    cv::Mat bgr = to_bgr(image);
    cv::Size target = fit_within(bgr.size(), preset);

    cv::Mat resized;
    if (target != bgr.size()) {
        cv::resize(bgr, resized, target, 0, 0, cv::INTER_AREA);
    } else {
        resized = bgr;
    }

    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, preset.jpeg_quality,
                               cv::IMWRITE_JPEG_OPTIMIZE, 1};
    std::vector<uint8_t> jpeg;
    if (!cv::imencode(".jpg", resized, jpeg, params)) {
        throw std::runtime_error("[image_prep] JPEG encode failed");
    }

    std::cout << "[image_prep] " << preset.name << ": " << image.cols << "x" << image.rows
              << " -> " << resized.cols << "x" << resized.rows << " q" << preset.jpeg_quality
              << ", " << jpeg.size() << " bytes" << std::endl;
    return jpeg;
}

std::vector<uint8_t> optimize_image(const std::string& path, const std::string& preset) {
    find_preset(preset);

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("[image_prep] cannot open " + path);
    std::streamsize original_size = in.tellg();

    cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (image.empty()) throw std::runtime_error("[image_prep] not a readable image: " + path);

    std::vector<uint8_t> jpeg = optimize_image(image, preset);

    double reduction = original_size > 0 ? 100.0 * (1.0 - static_cast<double>(jpeg.size()) / original_size) : 0.0;
    std::cout << "[image_prep] " << original_size << " -> " << jpeg.size() << " bytes ("
              << static_cast<int>(reduction) << "% smaller), about "
              << static_cast<int>(jpeg.size() / LINK_BYTES_PER_SECOND + 0.5) << " s on air" << std::endl;
    return jpeg;
}

void save_buffer(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("cannot write " + path);

    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("short write to " + path);
}
