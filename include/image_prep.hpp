#pragma once

#include <opencv2/opencv.hpp>

#include <cstdint>
#include <string>
#include <vector>

struct ImagePreset {
    const char* name;
    int max_width;
    int max_height;
    int jpeg_quality;
};

// thumbnail, small, medium, large.
// Throws std::invalid_argument for any other name.
const ImagePreset& find_preset(const std::string& name);

// Fit inside the preset box, never enlarging
cv::Size fit_within(const cv::Size& size, const ImagePreset& preset);

// Flattens alpha over white and makes grayscale 3-channel
cv::Mat to_bgr(const cv::Mat& image);

// Re-encodes `image` as a JPEG sized for the radio link
std::vector<uint8_t> optimize_image(const cv::Mat& image, const std::string& preset);

// Throws std::runtime_error if `path` is not a readable image
std::vector<uint8_t> optimize_image(const std::string& path, const std::string& preset);

void save_buffer(const std::string& path, const std::vector<uint8_t>& data);
