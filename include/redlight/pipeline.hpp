#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "redlight/annotator.hpp"
#include "redlight/config.hpp"
#include "redlight/crossing_detector.hpp"
#include "redlight/evidence_store.hpp"
#include "redlight/evidence_window.hpp"
#include "redlight/frame_source.hpp"
#include "redlight/frame_timeline.hpp"
#include "redlight/ocr.hpp"
#include "redlight/profile_store.hpp"
#include "redlight/sink.hpp"
#include "redlight/tracker.hpp"
#include "redlight/types.hpp"

namespace redlight {

struct PipelineSettings {
    std::string camera_id{"cam0"};
    std::string location_id{"DEFAULT_LOCATION_000"};
    StopLine stop_line;
    ZoneFactors zone;
    FineConfig fine;
    double clip_seconds = 3.0;
    double window_seconds = 10.0;
};

// Capabilities a pipeline borrows; they must outlive it.
struct PipelineServices {
    Tracker& tracker;
    OcrEngine& ocr;
    EvidenceStore& evidence;
    ProfileStore& profiles;
    ViolationSink& sink;
};

struct ProfileError {
    std::string plate;
    std::string violation_id;
    std::string message;
};

struct FrameReport {
    std::int64_t frame_index = 0;
    bool is_red = false;
    std::vector<TrackObservation> observations;
    std::vector<ViolationRecord> records;
    std::vector<ProfileError> profile_errors;
    int sink_failures = 0;
};

struct PipelineStats {
    std::int64_t frames = 0;
    std::int64_t violations = 0;
    std::int64_t profile_errors = 0;
    std::int64_t sink_failures = 0;
};

/**
 * Per-camera violation pipeline.
 *
 * Frames are numbered 0, 1, 2 ... in the order processFrame() sees them.
 * Each frame: signal state, tracker, crossing detection, rendering, evidence
 * window, then one violation unit (OCR, fine, snapshot, clip, profile,
 * sink) per newly crossing track. A track id produces at most one
 * ViolationRecord for the lifetime of the pipeline.
 */
class ViolationPipeline {
public:
    ViolationPipeline(PipelineSettings settings, FrameTimeline timeline, PipelineServices services);

    FrameReport processFrame(const cv::Mat& frame);

    // Reads until the source is exhausted or requestStop() is called.
    // Rendered frames go to `annotated` when it is open.
    PipelineStats run(FrameSource& source, cv::VideoWriter* annotated = nullptr);

    void requestStop() { stop_requested_.store(true); }
    bool stopRequested() const { return stop_requested_.load(); }

    const PipelineStats& stats() const { return stats_; }
    const CrossingDetector& detector() const { return detector_; }
    const EvidenceWindow& window() const { return window_; }
    const FrameTimeline& timeline() const { return timeline_; }
    const cv::Mat& lastRendered() const { return last_rendered_; }
    std::int64_t nextFrameIndex() const { return next_frame_index_; }

    std::string makeViolationId(std::int64_t frame_index, int track_id) const;

private:
    ViolationRecord handleViolation(const CrossingEvent& event, const cv::Mat& rendered, FrameReport& report);

    PipelineSettings settings_;
    FrameTimeline timeline_;
    PipelineServices services_;
    CrossingDetector detector_;
    EvidenceWindow window_;
    Annotator annotator_;
    std::int64_t clip_half_frames_;
    std::int64_t stale_after_frames_;
    std::int64_t next_frame_index_ = 0;
    PipelineStats stats_;
    cv::Mat last_rendered_;
    std::atomic<bool> stop_requested_{false};
};

}  // namespace redlight
