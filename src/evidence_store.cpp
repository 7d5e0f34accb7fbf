#include "redlight/evidence_store.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

namespace redlight {
namespace {

std::string sanitizeName(const std::string& name, const char* fallback) {
    std::string sanitized;
    sanitized.reserve(name.size());
    for (char ch : name) {
        if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_') {
            sanitized.push_back(ch);
        }
    }
    if (sanitized.empty()) {
        sanitized = fallback;
    }
    return sanitized;
}

bool ensureDirectory(const std::string& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        std::cerr << "[Evidence] Cannot create " << directory << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

}  // namespace

DiskEvidenceStore::DiskEvidenceStore(const EvidenceConfig& config)
    : image_dir_(config.imageDir()), clip_dir_(config.clipDir()) {
    ensureDirectory(image_dir_);
    ensureDirectory(clip_dir_);
}

std::string DiskEvidenceStore::evidenceName(const std::string& plate, const std::string& violation_id) {
    return sanitizeName(plate, kUnknownPlate) + "_" + sanitizeName(violation_id, "violation");
}

std::optional<std::string> DiskEvidenceStore::saveSnapshot(const cv::Mat& frame,
                                                           const std::string& plate,
                                                           const std::string& violation_id) {
    if (frame.empty() || !ensureDirectory(image_dir_)) {
        return std::nullopt;
    }
    const std::filesystem::path path =
        std::filesystem::path(image_dir_) / (evidenceName(plate, violation_id) + ".jpg");
    try {
        if (!cv::imwrite(path.string(), frame)) {
            std::cerr << "[Evidence] imwrite refused " << path << std::endl;
            return std::nullopt;
        }
    } catch (const cv::Exception& ex) {
        std::cerr << "[Evidence] Snapshot write failed: " << ex.what() << std::endl;
        return std::nullopt;
    }
    return path.generic_string();
}

std::optional<std::string> DiskEvidenceStore::saveClip(const std::vector<cv::Mat>& frames,
                                                       double fps,
                                                       const std::string& plate,
                                                       const std::string& violation_id) {
    if (frames.empty()) {
        std::cerr << "[Evidence] No retained frames for clip of " << plate << std::endl;
        return std::nullopt;
    }
    if (!ensureDirectory(clip_dir_)) {
        return std::nullopt;
    }
    const std::filesystem::path path =
        std::filesystem::path(clip_dir_) / (evidenceName(plate, violation_id) + ".mp4");
    try {
        const cv::Size size = frames.front().size();
        cv::VideoWriter writer(path.string(), cv::VideoWriter::fourcc('m', 'p', '4', 'v'),
                               fps > 0.0 ? fps : 30.0, size);
        if (!writer.isOpened()) {
            std::cerr << "[Evidence] Cannot open video writer for " << path << std::endl;
            return std::nullopt;
        }
        for (const auto& frame : frames) {
            if (frame.size() != size) {
                continue;
            }
            writer.write(frame);
        }
        writer.release();
    } catch (const cv::Exception& ex) {
        std::cerr << "[Evidence] Clip write failed: " << ex.what() << std::endl;
        return std::nullopt;
    }
    return path.generic_string();
}

}  // namespace redlight
