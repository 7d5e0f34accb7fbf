#include "redlight/ocr.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#ifdef REDLIGHT_HAS_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace redlight {

namespace {

constexpr const char* kPlateWhitelist = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr int kCrnnHeight = 32;
constexpr int kCrnnWidth = 100;

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(first, last - first + 1);
}

std::filesystem::path scratchImagePath() {
    static std::atomic<unsigned long> counter{0};
    const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    return std::filesystem::temp_directory_path() /
           ("redlight_ocr_" + std::to_string(tid) + "_" + std::to_string(counter++) + ".png");
}

}  // namespace

cv::Mat preprocessPlateRoi(const cv::Mat& roi) {
    if (roi.empty()) {
        return {};
    }
    cv::Mat gray;
    if (roi.channels() == 3) {
        cv::cvtColor(roi, gray, cv::COLOR_BGR2GRAY);
    } else if (roi.channels() == 4) {
        cv::cvtColor(roi, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = roi;
    }
    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
    cv::Mat binary;
    cv::adaptiveThreshold(blurred, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, 11, 2);
    return binary;
}

OcrReading decodeCtcGreedy(const float* scores, int steps, int classes, const std::string& alphabet) {
    OcrReading reading;
    if (!scores || steps <= 0 || classes <= 1) {
        return reading;
    }

    double confidence_sum = 0.0;
    int emitted = 0;
    int previous = 0;
    for (int t = 0; t < steps; ++t) {
        const float* row = scores + static_cast<std::size_t>(t) * classes;
        const float max_logit = *std::max_element(row, row + classes);
        double denom = 0.0;
        int best = 0;
        for (int c = 0; c < classes; ++c) {
            denom += std::exp(static_cast<double>(row[c] - max_logit));
            if (row[c] > row[best]) best = c;
        }
        if (best != 0 && best != previous && best - 1 < static_cast<int>(alphabet.size())) {
            reading.text.push_back(alphabet[best - 1]);
            confidence_sum += 1.0 / denom;    // softmax of the arg max
            ++emitted;
        }
        previous = best;
    }
    reading.confidence = emitted > 0 ? confidence_sum / emitted : 0.0;
    return reading;
}

// ---------------------------------------------------------------- OcrChain

void OcrChain::add(std::unique_ptr<OcrEngine> engine) {
    if (engine) {
        engines_.push_back(std::move(engine));
    }
}

std::optional<OcrReading> OcrChain::read(const cv::Mat& roi) {
    if (roi.empty() || engines_.empty()) {
        return std::nullopt;
    }
    const cv::Mat prepared = preprocessPlateRoi(roi);
    for (auto& engine : engines_) {
        try {
            auto reading = engine->read(prepared);
            if (reading && !trim(reading->text).empty()) {
                reading->text = trim(reading->text);
                reading->confidence = std::clamp(reading->confidence, 0.0, 1.0);
                return reading;
            }
        } catch (const std::exception& ex) {
            std::cerr << "[OCR] " << engine->name() << " failed: " << ex.what() << std::endl;
        }
    }
    return std::nullopt;
}

std::string OcrChain::name() const {
    if (engines_.empty()) {
        return "none";
    }
    std::string joined;
    for (const auto& engine : engines_) {
        if (!joined.empty()) joined += " -> ";
        joined += engine->name();
    }
    return joined;
}

// ----------------------------------------------------------- CrnnOcrEngine

struct CrnnOcrEngine::Impl {
#if defined(REDLIGHT_HAS_ONNXRUNTIME)
    Impl() : env(ORT_LOGGING_LEVEL_WARNING, "redlight-ocr") {
        session_options.SetIntraOpNumThreads(1);
        session_options.SetGraphOptimizationLevel(ORT_ENABLE_EXTENDED);
    }
    Ort::Env env;
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;
    std::string input_name;
    std::string output_name;
#endif
    int input_height = kCrnnHeight;
    int input_width = kCrnnWidth;
};

CrnnOcrEngine::CrnnOcrEngine(const std::string& model_path, std::string alphabet)
    : alphabet_(std::move(alphabet)) {
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("CRNN model file not found: " + model_path);
    }
#if defined(REDLIGHT_HAS_ONNXRUNTIME)
    impl_ = std::make_unique<Impl>();
    impl_->session = std::make_unique<Ort::Session>(impl_->env, model_path.c_str(), impl_->session_options);

    auto input_names = impl_->session->GetInputNames();
    auto output_names = impl_->session->GetOutputNames();
    if (input_names.empty() || output_names.empty()) {
        throw std::runtime_error("CRNN model has no inputs or outputs: " + model_path);
    }
    impl_->input_name = input_names.front();
    impl_->output_name = output_names.front();

    auto shape = impl_->session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() == 4) {
        if (shape[2] > 0) impl_->input_height = static_cast<int>(shape[2]);
        if (shape[3] > 0) impl_->input_width = static_cast<int>(shape[3]);
    }
    std::cout << "[OCR] Loaded CRNN model " << model_path << " (" << impl_->input_width << "x"
              << impl_->input_height << ")" << std::endl;
#else
    throw std::runtime_error("ONNXRuntime backend is not available");
#endif
}

CrnnOcrEngine::~CrnnOcrEngine() = default;

std::optional<OcrReading> CrnnOcrEngine::read(const cv::Mat& roi) {
    if (roi.empty() || !impl_) {
        return std::nullopt;
    }
#if defined(REDLIGHT_HAS_ONNXRUNTIME)
    cv::Mat gray = roi;
    if (gray.channels() == 3) {
        cv::cvtColor(roi, gray, cv::COLOR_BGR2GRAY);
    }
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(impl_->input_width, impl_->input_height));
    cv::Mat input;
    resized.convertTo(input, CV_32F, 1.0 / 127.5, -1.0);

    std::vector<float> tensor(input.begin<float>(), input.end<float>());
    std::array<int64_t, 4> input_shape{1, 1, impl_->input_height, impl_->input_width};
    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, tensor.data(), tensor.size(), input_shape.data(), input_shape.size());

    const char* input_names[] = {impl_->input_name.c_str()};
    const char* output_names[] = {impl_->output_name.c_str()};
    auto outputs = impl_->session->Run(Ort::RunOptions{}, input_names, &input_tensor, 1, output_names, 1);
    if (outputs.empty() || !outputs.front().IsTensor()) {
        return std::nullopt;
    }

    // [T, 1, C] or [1, T, C]
    auto shape = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() != 3) {
        return std::nullopt;
    }
    const int steps = static_cast<int>(shape[0] == 1 ? shape[1] : shape[0]);
    const int classes = static_cast<int>(shape[2]);
    OcrReading reading = decodeCtcGreedy(outputs.front().GetTensorData<float>(), steps, classes, alphabet_);
    if (reading.text.empty()) {
        return std::nullopt;
    }
    return reading;
#else
    return std::nullopt;
#endif
}

// ------------------------------------------------------ TesseractCliEngine

TesseractCliEngine::TesseractCliEngine(std::string command, double confidence)
    : command_(std::move(command)), confidence_(confidence) {
    if (command_.empty()) {
        throw std::invalid_argument("tesseract command must not be empty");
    }
}

std::optional<OcrReading> TesseractCliEngine::read(const cv::Mat& roi) {
    if (roi.empty()) {
        return std::nullopt;
    }
    const auto image_path = scratchImagePath();
    if (!cv::imwrite(image_path.string(), roi)) {
        throw std::runtime_error("failed to write scratch image " + image_path.string());
    }

    const std::string cmd = command_ + " \"" + image_path.string() + "\" stdout --psm 7 -c tessedit_char_whitelist=" +
                            kPlateWhitelist + " 2>/dev/null";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::error_code ec;
        std::filesystem::remove(image_path, ec);
        throw std::runtime_error("failed to launch tesseract");
    }
    std::string output;
    std::array<char, 256> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output += buffer.data();
    }
    const int status = pclose(pipe);
    std::error_code ec;
    std::filesystem::remove(image_path, ec);

    if (status != 0) {
        throw std::runtime_error("tesseract exited with status " + std::to_string(status));
    }
    output = trim(output);
    if (output.empty()) {
        return std::nullopt;
    }
    return OcrReading{output, confidence_};
}

// ------------------------------------------------------------- makeOcrChain

std::unique_ptr<OcrChain> makeOcrChain(const OcrConfig& config) {
    auto chain = std::make_unique<OcrChain>();
    for (const auto& backend : config.backends) {
        try {
            if (backend == "crnn") {
                chain->add(std::make_unique<CrnnOcrEngine>(config.crnn_model, config.alphabet));
            } else if (backend == "tesseract") {
                chain->add(std::make_unique<TesseractCliEngine>(config.tesseract_command, config.tesseract_confidence));
            } else if (backend == "none") {
                break;
            } else {
                std::cerr << "[OCR] Unknown backend '" << backend << "', skipping" << std::endl;
            }
        } catch (const std::exception& ex) {
            std::cerr << "[OCR] Backend '" << backend << "' unavailable: " << ex.what() << std::endl;
        }
    }
    std::cout << "[OCR] Engine chain: " << chain->name() << std::endl;
    return chain;
}

}  // namespace redlight
