#include <gtest/gtest.h>

#include <stdexcept>

#include "redlight/ocr.hpp"

using redlight::OcrChain;
using redlight::OcrEngine;
using redlight::OcrReading;

namespace {

class ScriptedEngine : public OcrEngine {
public:
    enum class Mode { Read, Empty, Throw };

    ScriptedEngine(std::string name, Mode mode, OcrReading reading = {}, int* calls = nullptr)
        : name_(std::move(name)), mode_(mode), reading_(std::move(reading)), calls_(calls) {}

    std::optional<OcrReading> read(const cv::Mat& roi) override {
        if (calls_) ++*calls_;
        last_channels_ = roi.channels();
        switch (mode_) {
        case Mode::Read: return reading_;
        case Mode::Empty: return std::nullopt;
        default: throw std::runtime_error("engine crashed");
        }
    }

    std::string name() const override { return name_; }

    static int last_channels_;

private:
    std::string name_;
    Mode mode_;
    OcrReading reading_;
    int* calls_;
};

int ScriptedEngine::last_channels_ = 0;

cv::Mat plateImage() {
    return cv::Mat(40, 120, CV_8UC3, cv::Scalar(200, 200, 200));
}

}  // namespace

TEST(OcrChain, FirstEngineWithTextWins) {
    int second_calls = 0;
    OcrChain chain;
    chain.add(std::make_unique<ScriptedEngine>("primary", ScriptedEngine::Mode::Read, OcrReading{" ab12 ", 0.9}));
    chain.add(std::make_unique<ScriptedEngine>("secondary", ScriptedEngine::Mode::Read, OcrReading{"ZZ", 0.7},
                                               &second_calls));

    const auto reading = chain.read(plateImage());
    ASSERT_TRUE(reading.has_value());
    EXPECT_EQ(reading->text, "ab12");
    EXPECT_DOUBLE_EQ(reading->confidence, 0.9);
    EXPECT_EQ(second_calls, 0);
    EXPECT_EQ(chain.name(), "primary -> secondary");
}

TEST(OcrChain, FallsThroughEmptyAndFailingEngines) {
    OcrChain chain;
    chain.add(std::make_unique<ScriptedEngine>("empty", ScriptedEngine::Mode::Empty));
    chain.add(std::make_unique<ScriptedEngine>("blank", ScriptedEngine::Mode::Read, OcrReading{"   ", 0.8}));
    chain.add(std::make_unique<ScriptedEngine>("broken", ScriptedEngine::Mode::Throw));
    chain.add(std::make_unique<ScriptedEngine>("last", ScriptedEngine::Mode::Read, OcrReading{"XY9", 1.7}));

    const auto reading = chain.read(plateImage());
    ASSERT_TRUE(reading.has_value());
    EXPECT_EQ(reading->text, "XY9");
    EXPECT_DOUBLE_EQ(reading->confidence, 1.0);
}

TEST(OcrChain, AllEnginesFailingYieldsNothing) {
    OcrChain chain;
    chain.add(std::make_unique<ScriptedEngine>("broken", ScriptedEngine::Mode::Throw));
    chain.add(std::make_unique<ScriptedEngine>("empty", ScriptedEngine::Mode::Empty));
    EXPECT_FALSE(chain.read(plateImage()).has_value());
}

TEST(OcrChain, EmptyChainOrEmptyRoiYieldsNothing) {
    OcrChain empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.name(), "none");
    EXPECT_FALSE(empty.read(plateImage()).has_value());

    int calls = 0;
    OcrChain chain;
    chain.add(std::make_unique<ScriptedEngine>("p", ScriptedEngine::Mode::Read, OcrReading{"A", 1.0}, &calls));
    EXPECT_FALSE(chain.read(cv::Mat()).has_value());
    EXPECT_EQ(calls, 0);
}

TEST(OcrChain, EnginesReceiveBinarisedRoi) {
    OcrChain chain;
    chain.add(std::make_unique<ScriptedEngine>("p", ScriptedEngine::Mode::Read, OcrReading{"A", 1.0}));
    chain.read(plateImage());
    EXPECT_EQ(ScriptedEngine::last_channels_, 1);
}

TEST(OcrPreprocess, ProducesBinaryImageOfSameSize) {
    cv::Mat roi(30, 90, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::rectangle(roi, cv::Rect(20, 5, 10, 20), cv::Scalar(255, 255, 255), cv::FILLED);
    const cv::Mat binary = redlight::preprocessPlateRoi(roi);
    ASSERT_EQ(binary.size(), roi.size());
    EXPECT_EQ(binary.type(), CV_8UC1);
    for (int y = 0; y < binary.rows; ++y) {
        for (int x = 0; x < binary.cols; ++x) {
            const auto v = binary.at<unsigned char>(y, x);
            EXPECT_TRUE(v == 0 || v == 255);
        }
    }
    EXPECT_TRUE(redlight::preprocessPlateRoi(cv::Mat()).empty());
}

TEST(CtcDecode, CollapsesRepeatsAndDropsBlanks) {
    // classes: blank, 'A', 'B'
    const std::vector<float> logits = {
        0, 10, 0,    // A
        0, 10, 0,    // A (repeat)
        10, 0, 0,    // blank
        0, 10, 0,    // A
        0, 0, 10,    // B
        10, 0, 0,    // blank
    };
    const auto reading = redlight::decodeCtcGreedy(logits.data(), 6, 3, "AB");
    EXPECT_EQ(reading.text, "AAB");
    EXPECT_GT(reading.confidence, 0.99);
    EXPECT_LE(reading.confidence, 1.0);
}

TEST(CtcDecode, AllBlankGivesEmptyReading) {
    const std::vector<float> logits = {5, 0, 5, 0};
    const auto reading = redlight::decodeCtcGreedy(logits.data(), 2, 2, "A");
    EXPECT_TRUE(reading.text.empty());
    EXPECT_DOUBLE_EQ(reading.confidence, 0.0);
}

TEST(OcrFactory, UnknownAndUnavailableBackendsAreSkipped) {
    redlight::OcrConfig config;
    config.backends = {"crnn", "bogus"};
    config.crnn_model = "/nonexistent/redlight/crnn.onnx";
    auto chain = redlight::makeOcrChain(config);
    EXPECT_TRUE(chain->empty());

    config.backends = {"tesseract"};
    EXPECT_EQ(redlight::makeOcrChain(config)->size(), 1u);
}
