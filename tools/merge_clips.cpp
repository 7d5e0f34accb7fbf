#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace {

void print_usage(const char *executable)
{
    std::cout << "Usage: " << executable
              << " [--clip-dir <dir>] [--output <path>] [--clips <name> [<name> ...]]\n"
              << "Concatenates evidence clips into one video. Without --clips every .mp4 in\n"
              << "--clip-dir is merged in file name order." << std::endl;
}

std::vector<std::filesystem::path> list_clips(const std::filesystem::path &directory)
{
    std::vector<std::filesystem::path> clips;
    if (!std::filesystem::is_directory(directory)) {
        throw std::runtime_error("Clip directory does not exist: " + directory.string());
    }
    for (const auto &entry : std::filesystem::directory_iterator(directory)) {
        if (entry.is_regular_file() && entry.path().extension() == ".mp4") {
            clips.push_back(entry.path());
        }
    }
    std::sort(clips.begin(), clips.end());
    return clips;
}

std::size_t merge_clips(const std::vector<std::filesystem::path> &clips, const std::filesystem::path &output)
{
    cv::VideoWriter writer;
    cv::Size frame_size;
    std::size_t merged = 0;

    for (const auto &path : clips) {
        if (!std::filesystem::exists(path)) {
            std::cerr << "[merge_clips] Clip not found, skipping: " << path << std::endl;
            continue;
        }
        cv::VideoCapture capture(path.string());
        if (!capture.isOpened()) {
            std::cerr << "[merge_clips] Cannot open clip, skipping: " << path << std::endl;
            continue;
        }

        if (!writer.isOpened()) {
            double fps = capture.get(cv::CAP_PROP_FPS);
            if (fps <= 0.0) {
                fps = 30.0;
            }
            frame_size = cv::Size(static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH)),
                                  static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT)));
            if (output.has_parent_path()) {
                std::filesystem::create_directories(output.parent_path());
            }
            if (!writer.open(output.string(), cv::VideoWriter::fourcc('m', 'p', '4', 'v'), fps, frame_size)) {
                throw std::runtime_error("Failed to open output video: " + output.string());
            }
        }

        cv::Mat frame;
        cv::Mat resized;
        while (capture.read(frame)) {
            if (frame.size() != frame_size) {
                cv::resize(frame, resized, frame_size);
                writer.write(resized);
            } else {
                writer.write(frame);
            }
        }
        ++merged;
        std::cout << "[merge_clips] Appended " << path << std::endl;
    }
    return merged;
}

}  // namespace

int main(int argc, char *argv[])
{
    std::filesystem::path clip_dir = "output/clips";
    std::filesystem::path output = "output/videos/merged_evidence.mp4";
    std::vector<std::string> names;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--clip-dir" && i + 1 < argc) {
            clip_dir = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output = argv[++i];
        } else if (arg == "--clips") {
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                names.emplace_back(argv[++i]);
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        std::vector<std::filesystem::path> clips;
        if (names.empty()) {
            clips = list_clips(clip_dir);
        } else {
            for (const auto &name : names) {
                clips.push_back(clip_dir / name);
            }
        }
        if (clips.empty()) {
            std::cerr << "[merge_clips] No clips to merge" << std::endl;
            return 1;
        }

        const std::size_t merged = merge_clips(clips, output);
        if (merged == 0) {
            std::cerr << "[merge_clips] No valid clips could be loaded" << std::endl;
            return 1;
        }
        std::cout << "[merge_clips] Merged " << merged << " clips into " << output << std::endl;
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
