#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/videoio.hpp>

#include "redlight/common.hpp"
#include "redlight/config.hpp"
#include "redlight/evidence_store.hpp"
#include "redlight/frame_source.hpp"
#include "redlight/frame_timeline.hpp"
#include "redlight/ocr.hpp"
#include "redlight/pipeline.hpp"
#include "redlight/profile_store.hpp"
#include "redlight/sink.hpp"
#include "redlight/thread_pool.hpp"
#include "redlight/tracker.hpp"
#include "redlight/vehicle_detector.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void signalHandler(int signal) {
    gSignalStatus = signal;
}

void printUsage(const char* executable) {
    std::cout << "Usage: " << executable << " [--config <path>] [--video <path> --stop-line x1,y1,x2,y2]\n"
              << "       [--signal-json <path>] [--output <path>] [--force-red] [--sink mqtt|jsonl]\n"
              << "Detects red-light stop-line crossings, writes snapshot and clip evidence,\n"
              << "updates driver profiles and publishes one violation record per vehicle." << std::endl;
}

struct CliOptions {
    std::string config_path{"config/local.config.json"};
    bool config_given = false;
    std::string video;
    std::string stop_line;
    std::string signal_json;
    std::string output;
    std::string sink;
    bool force_red = false;
};

// Keeps track of the running pipelines so a signal can stop all of them.
class PipelineRegistry {
public:
    void add(redlight::ViolationPipeline* pipeline) {
        std::lock_guard<std::mutex> lock(mutex_);
        pipelines_.push_back(pipeline);
        if (stopped_) pipeline->requestStop();
    }

    void remove(redlight::ViolationPipeline* pipeline) {
        std::lock_guard<std::mutex> lock(mutex_);
        pipelines_.erase(std::remove(pipelines_.begin(), pipelines_.end(), pipeline), pipelines_.end());
    }

    void stopAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        for (auto* pipeline : pipelines_) pipeline->requestStop();
    }

private:
    std::mutex mutex_;
    std::vector<redlight::ViolationPipeline*> pipelines_;
    bool stopped_ = false;
};

redlight::Timestamp cameraStart(const redlight::CameraConfig& camera) {
    if (camera.start_time.empty()) {
        return redlight::Clock::now();
    }
    if (auto parsed = redlight::parseIsoTimestamp(camera.start_time)) {
        return *parsed;
    }
    std::cerr << "[" << camera.id << "] Unparseable start_time '" << camera.start_time << "', using now"
              << std::endl;
    return redlight::Clock::now();
}

redlight::PipelineStats runCamera(const redlight::AppConfig& config,
                                  const redlight::CameraConfig& camera,
                                  redlight::ProfileStore& profiles,
                                  redlight::ViolationSink& sink,
                                  PipelineRegistry& registry) {
    redlight::VideoFrameSource source(camera.video);

    auto detector = std::make_unique<redlight::VehicleDetector>(config.detector);
    detector->load();
    redlight::YoloTracker tracker(std::move(detector),
                                  redlight::IouTracker(config.tracker.iou_threshold, config.tracker.max_age));

    auto ocr = redlight::makeOcrChain(config.ocr);
    redlight::DiskEvidenceStore evidence(config.evidence);

    redlight::FrameTimeline timeline(cameraStart(camera), source.fps(),
                                     redlight::loadSignalIntervals(camera.signal_json), camera.force_red);
    std::cout << "[" << camera.id << "] " << timeline.intervals().size() << " red intervals"
              << (camera.force_red ? ", forced red" : "") << std::endl;

    redlight::PipelineSettings settings;
    settings.camera_id = camera.id;
    settings.location_id = config.location_id;
    settings.stop_line = camera.stop_line;
    settings.zone = camera.zone;
    settings.fine = config.fine;
    settings.clip_seconds = config.evidence.clip_seconds;
    settings.window_seconds = config.evidence.window_seconds;

    redlight::ViolationPipeline pipeline(settings, timeline,
                                         redlight::PipelineServices{tracker, *ocr, evidence, profiles, sink});

    cv::VideoWriter annotated;
    if (!camera.output.empty()) {
        const auto parent = std::filesystem::path(camera.output).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        annotated.open(camera.output, cv::VideoWriter::fourcc('m', 'p', '4', 'v'), source.fps(), source.frameSize());
        if (!annotated.isOpened()) {
            std::cerr << "[" << camera.id << "] Cannot write annotated video " << camera.output << std::endl;
        }
    }

    registry.add(&pipeline);
    redlight::PipelineStats stats;
    try {
        stats = pipeline.run(source, &annotated);
    } catch (...) {
        registry.remove(&pipeline);
        throw;
    }
    registry.remove(&pipeline);
    return stats;
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
            options.config_given = true;
        } else if (arg == "--video" && i + 1 < argc) {
            options.video = argv[++i];
        } else if (arg == "--stop-line" && i + 1 < argc) {
            options.stop_line = argv[++i];
        } else if (arg == "--signal-json" && i + 1 < argc) {
            options.signal_json = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            options.output = argv[++i];
        } else if (arg == "--sink" && i + 1 < argc) {
            options.sink = argv[++i];
        } else if (arg == "--force-red") {
            options.force_red = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        redlight::AppConfig config;
        if (options.config_given || std::filesystem::exists(options.config_path)) {
            config = redlight::loadConfig(options.config_path);
            std::cout << "[Config] Loaded " << config.source_path << std::endl;
        } else if (options.video.empty()) {
            std::cerr << "No configuration at " << options.config_path << " and no --video given" << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        redlight::applyEnvironment(config);

        if (!options.video.empty()) {
            if (options.stop_line.empty()) {
                std::cerr << "--video requires --stop-line x1,y1,x2,y2" << std::endl;
                return 1;
            }
            redlight::CameraConfig camera;
            camera.video = options.video;
            camera.stop_line = redlight::parseStopLine(options.stop_line);
            camera.signal_json = options.signal_json;
            camera.output = options.output;
            camera.force_red = options.force_red;
            config.cameras = {camera};
        }
        if (!options.sink.empty()) {
            config.sink.type = options.sink;
        }
        redlight::validateConfig(config);
        if (config.cameras.empty()) {
            std::cerr << "No cameras configured" << std::endl;
            return 1;
        }

        redlight::InMemoryProfileStore profiles;
        profiles.load(config.profiles_path);

        std::unique_ptr<redlight::ViolationSink> sink = redlight::makeViolationSink(config);

        PipelineRegistry registry;
        const std::size_t workers =
            std::min<std::size_t>(static_cast<std::size_t>(config.thread_pool_size), config.cameras.size());
        redlight::ThreadPool pool(workers);

        std::vector<std::future<redlight::PipelineStats>> jobs;
        for (const auto& camera : config.cameras) {
            jobs.push_back(pool.enqueue(
                [&config, &profiles, &sink, &registry](const redlight::CameraConfig& cam) {
                    return runCamera(config, cam, profiles, *sink, registry);
                },
                camera));
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        int failures = 0;
        redlight::PipelineStats total;
        for (std::size_t i = 0; i < jobs.size(); ++i) {
            while (jobs[i].wait_for(std::chrono::milliseconds(200)) == std::future_status::timeout) {
                if (gSignalStatus != 0) {
                    registry.stopAll();
                }
            }
            try {
                redlight::PipelineStats stats = jobs[i].get();
                total.frames += stats.frames;
                total.violations += stats.violations;
                total.sink_failures += stats.sink_failures;
                total.profile_errors += stats.profile_errors;
            } catch (const std::exception& ex) {
                std::cerr << "[" << config.cameras[i].id << "] Error: " << ex.what() << std::endl;
                ++failures;
            }
        }
        pool.shutdown();

        profiles.save(config.profiles_path);
        std::cout << "[Profiles] Saved " << profiles.size() << " profiles to " << config.profiles_path << std::endl;
        std::cout << "Processed " << total.frames << " frames, " << total.violations << " violations ("
                  << total.sink_failures << " sink failures, " << total.profile_errors << " profile errors)"
                  << std::endl;

        if (failures > 0 || total.profile_errors > 0) {
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
