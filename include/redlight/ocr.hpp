#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "redlight/config.hpp"

namespace redlight {

struct OcrReading {
    std::string text;
    double confidence = 0.0;    // [0, 1]
};

// A plate reader. read() returns nullopt when the engine produced nothing
// usable; it may also throw, which callers treat the same way.
class OcrEngine {
public:
    virtual ~OcrEngine() = default;
    virtual std::optional<OcrReading> read(const cv::Mat& roi) = 0;
    virtual std::string name() const = 0;
};

// Gray, 5x5 Gaussian blur, adaptive Gaussian threshold (inverted, block 11, C 2).
cv::Mat preprocessPlateRoi(const cv::Mat& roi);

// Greedy CTC over a [steps x classes] score matrix, class 0 being the blank
// and class i mapping to alphabet[i - 1]. Scores are logits.
OcrReading decodeCtcGreedy(const float* scores, int steps, int classes, const std::string& alphabet);

/**
 * Ordered fallback list of engines. The ROI is preprocessed once and handed
 * to each engine in turn; the first non-empty reading wins. An engine that
 * throws is logged and skipped for that call only.
 */
class OcrChain : public OcrEngine {
public:
    void add(std::unique_ptr<OcrEngine> engine);

    std::optional<OcrReading> read(const cv::Mat& roi) override;
    std::string name() const override;

    std::size_t size() const { return engines_.size(); }
    bool empty() const { return engines_.empty(); }

private:
    std::vector<std::unique_ptr<OcrEngine>> engines_;
};

class CrnnOcrEngine : public OcrEngine {
public:
    CrnnOcrEngine(const std::string& model_path, std::string alphabet);
    ~CrnnOcrEngine() override;

    std::optional<OcrReading> read(const cv::Mat& roi) override;
    std::string name() const override { return "crnn"; }

private:
    struct Impl;
    std::string alphabet_;
    std::unique_ptr<Impl> impl_;
};

// Shells out to the tesseract binary in single-line mode with an
// alphanumeric whitelist. Tesseract's CLI reports no confidence, so a fixed
// value is attached to every reading.
class TesseractCliEngine : public OcrEngine {
public:
    TesseractCliEngine(std::string command, double confidence);

    std::optional<OcrReading> read(const cv::Mat& roi) override;
    std::string name() const override { return "tesseract"; }

private:
    std::string command_;
    double confidence_;
};

// Builds the chain in config order. Backends that fail to initialise are
// logged and left out; an empty chain means OCR is disabled.
std::unique_ptr<OcrChain> makeOcrChain(const OcrConfig& config);

}  // namespace redlight
