#include "fingerprint_extractor.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace sifinder {

namespace {

constexpr int kCoefficients = PhashExtractor::kBlockSize * PhashExtractor::kBlockSize;

float medianWithoutDc(const std::array<float, kCoefficients>& block)
{
    std::array<float, kCoefficients - 1> ac{};
    std::copy(block.begin() + 1, block.end(), ac.begin());

    // 63 values, the middle one is the median
    const auto mid = ac.begin() + ac.size() / 2;
    std::nth_element(ac.begin(), mid, ac.end());
    return *mid;
}

} // namespace

Fingerprint PhashExtractor::compute(const std::filesystem::path& image)
{
    cv::Mat pixels;
    try {
        pixels = cv::imread(image.string(), cv::IMREAD_GRAYSCALE);
    }
    catch (const cv::Exception& e) {
        throw DecodeError("Cannot decode '" + image.string() + "': " + e.what());
    }

    if (pixels.empty()) {
        throw DecodeError("Cannot decode '" + image.string() + "'");
    }

    SIFINDER_TRACE("extractor", "decoded ", image.filename().string(), " ", pixels.cols, "x", pixels.rows);
    return fromPixels(pixels);
}

Fingerprint PhashExtractor::fromPixels(const cv::Mat& pixels)
{
    if (pixels.empty()) {
        throw DecodeError("Empty image");
    }

    cv::Mat gray;
    switch (pixels.channels()) {
        case 1: gray = pixels; break;
        case 3: cv::cvtColor(pixels, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(pixels, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw DecodeError("Unsupported channel count " + std::to_string(pixels.channels()));
    }

    cv::Mat small;
    cv::resize(gray, small, cv::Size(kImageSize, kImageSize), 0, 0, cv::INTER_AREA);

    cv::Mat samples;
    small.convertTo(samples, CV_32F);

    cv::Mat frequencies;
    cv::dct(samples, frequencies);

    return fromFrequencies(frequencies);
}

Fingerprint PhashExtractor::fromFrequencies(const cv::Mat& frequencies)
{
    if (frequencies.type() != CV_32F || frequencies.rows < kBlockSize || frequencies.cols < kBlockSize) {
        throw std::invalid_argument("Expected a CV_32F matrix of at least 8x8 coefficients");
    }

    std::array<float, kCoefficients> block{};
    for (int y = 0; y < kBlockSize; ++y) {
        for (int x = 0; x < kBlockSize; ++x) {
            block[y * kBlockSize + x] = frequencies.at<float>(y, x);
        }
    }

    const float median = medianWithoutDc(block);

    std::uint64_t bits = 0;
    for (int i = 0; i < kCoefficients; ++i) {
        bits <<= 1;
        if (block[i] > median) bits |= 1u;
    }

    return Fingerprint(bits);
}

} // namespace sifinder
