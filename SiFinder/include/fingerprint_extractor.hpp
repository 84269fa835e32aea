#pragma once

#include <filesystem>

#include <opencv2/core.hpp>

#include "fingerprint.hpp"

namespace sifinder {

// compute() may be called from several threads at once
class FingerprintExtractor {
public:
    virtual ~FingerprintExtractor() = default;

    // Throws DecodeError if the file cannot be decoded as an image
    virtual Fingerprint compute(const std::filesystem::path& image) = 0;
};

// DCT perceptual hash: 32x32 grayscale, low 8x8 frequencies against their
// median (DC excluded from the median)
class PhashExtractor : public FingerprintExtractor {
public:
    static constexpr int kImageSize = 32;
    static constexpr int kBlockSize = 8;

    Fingerprint compute(const std::filesystem::path& image) override;

    // Any 1, 3 or 4 channel 8-bit matrix
    static Fingerprint fromPixels(const cv::Mat& pixels);

    // CV_32F DCT output of at least kBlockSize x kBlockSize
    static Fingerprint fromFrequencies(const cv::Mat& frequencies);
};

} // namespace sifinder
