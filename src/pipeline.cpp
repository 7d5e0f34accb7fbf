#include "redlight/pipeline.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <utility>

#include "redlight/common.hpp"
#include "redlight/fine_calculator.hpp"
#include "redlight/plate_normalizer.hpp"

namespace redlight {

namespace {

constexpr std::int64_t kProgressEvery = 100;

std::vector<TrackedBox> safeTrack(Tracker& tracker, const cv::Mat& frame, std::int64_t frame_index) {
    try {
        return tracker.update(frame);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] Tracker failed on frame " << frame_index << ": " << ex.what() << std::endl;
        return {};
    }
}

std::optional<OcrReading> safeRead(OcrEngine& ocr, const cv::Mat& roi) {
    if (roi.empty()) {
        return std::nullopt;
    }
    try {
        return ocr.read(roi);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] OCR failed: " << ex.what() << std::endl;
    }
    return std::nullopt;
}

}  // namespace

ViolationPipeline::ViolationPipeline(PipelineSettings settings, FrameTimeline timeline, PipelineServices services)
    : settings_(std::move(settings)),
      timeline_(std::move(timeline)),
      services_(services),
      window_(EvidenceWindow::capacityFor(timeline_.fps(), settings_.window_seconds)),
      clip_half_frames_(static_cast<std::int64_t>(timeline_.fps() * settings_.clip_seconds / 2.0)),
      stale_after_frames_(std::max<std::int64_t>(1, static_cast<std::int64_t>(timeline_.fps() * 2.0))) {}

std::string ViolationPipeline::makeViolationId(std::int64_t frame_index, int track_id) const {
    return settings_.location_id + "_" + settings_.camera_id + "_" + formatCompactTimestamp(timeline_.start()) +
           "_f" + std::to_string(frame_index) + "_t" + std::to_string(track_id);
}

FrameReport ViolationPipeline::processFrame(const cv::Mat& frame) {
    FrameReport report;
    const std::int64_t frame_index = next_frame_index_++;
    report.frame_index = frame_index;

    const Timestamp now = timeline_.timestampAt(frame_index);
    report.is_red = timeline_.isRed(now);

    const std::vector<TrackedBox> tracks = safeTrack(services_.tracker, frame, frame_index);

    std::vector<CrossingEvent> crossings;
    std::unordered_set<int> flagged;
    for (const auto& track : tracks) {
        const Point centroid = track.box.anchor();
        report.observations.push_back(TrackObservation{track.track_id, frame_index, centroid, track.box});
        detector_.observe(track.track_id, frame_index, centroid);

        if (detector_.phase(track.track_id) == TrackPhase::Logged) {
            flagged.insert(track.track_id);
            continue;
        }
        if (!report.is_red) {
            continue;
        }
        if (detector_.evaluate(track.track_id, centroid, settings_.stop_line, report.is_red) &&
            detector_.markLogged(track.track_id)) {
            crossings.push_back(CrossingEvent{track.track_id, frame_index, centroid, track.box, now, &frame});
            flagged.insert(track.track_id);
        }
    }

    cv::Mat rendered = annotator_.render(frame, tracks, settings_.stop_line, report.is_red, flagged,
                                         !crossings.empty());
    window_.push(frame_index, rendered, now);
    last_rendered_ = rendered;

    for (const auto& event : crossings) {
        report.records.push_back(handleViolation(event, rendered, report));
    }

    detector_.pruneStale(frame_index, stale_after_frames_);

    ++stats_.frames;
    stats_.violations += static_cast<std::int64_t>(report.records.size());
    stats_.profile_errors += static_cast<std::int64_t>(report.profile_errors.size());
    stats_.sink_failures += report.sink_failures;
    return report;
}

ViolationRecord ViolationPipeline::handleViolation(const CrossingEvent& event,
                                                   const cv::Mat& rendered,
                                                   FrameReport& report) {
    ViolationRecord record;
    record.id = makeViolationId(event.frame_index, event.track_id);
    record.location_id = settings_.location_id;
    record.track_id = event.track_id;
    record.frame_index = event.frame_index;
    record.timestamp = event.timestamp;

    const cv::Mat roi = event.frame ? extractROI(*event.frame, event.box) : cv::Mat();
    // Unread plates stay UNKNOWN with zero confidence and skip normalization.
    if (const auto reading = safeRead(services_.ocr, roi)) {
        record.vehicle_plate = recordPlate(normalizePlate(reading->text));
        record.ocr_confidence = roundDecimal(reading->confidence, 3);
    } else {
        record.vehicle_plate = kUnknownPlate;
        record.ocr_confidence = 0.0;
    }

    // UNKNOWN is a plate like any other here: its aggregate collects every unread violation.
    std::optional<ProfileAggregate> profile;
    try {
        profile = services_.profiles.get(record.vehicle_plate);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] Profile lookup for " << record.vehicle_plate << " failed: " << ex.what()
                  << std::endl;
    }
    record.fine_amount = computeFine(profile, settings_.zone, event.timestamp, settings_.fine);

    std::optional<std::string> snapshot;
    try {
        snapshot = services_.evidence.saveSnapshot(rendered, record.vehicle_plate, record.id);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] Snapshot failed: " << ex.what() << std::endl;
    }
    record.image_path = snapshot ? *snapshot : kSnapshotFailed;

    std::optional<std::string> clip;
    try {
        clip = services_.evidence.saveClip(window_.extractClip(event.frame_index, clip_half_frames_),
                                           timeline_.fps(), record.vehicle_plate, record.id);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] Clip failed: " << ex.what() << std::endl;
    }
    record.video_clip_path = clip ? *clip : kClipFailed;

    try {
        services_.profiles.upsert(record.vehicle_plate, record.id, event.timestamp);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] ERROR profile not updated for " << record.vehicle_plate << " (" << record.id
                  << "): " << ex.what() << std::endl;
        report.profile_errors.push_back(ProfileError{record.vehicle_plate, record.id, ex.what()});
    }

    bool submitted = false;
    try {
        submitted = services_.sink.submit(record);
    } catch (const std::exception& ex) {
        std::cerr << "[Pipeline] Sink threw for " << record.id << ": " << ex.what() << std::endl;
    }
    if (!submitted) {
        std::cerr << "[Pipeline] ERROR violation " << record.id << " was not accepted by the sink" << std::endl;
        ++report.sink_failures;
    }

    std::cout << "[Pipeline] Red-light violation for track " << record.track_id << " at frame "
              << record.frame_index << ": plate " << record.vehicle_plate << " fine " << record.fine_amount
              << std::endl;
    return record;
}

PipelineStats ViolationPipeline::run(FrameSource& source, cv::VideoWriter* annotated) {
    std::cout << "[Pipeline] " << settings_.camera_id << " started, stop line y=" << settings_.stop_line.thresholdY()
              << (timeline_.forceRed() ? " (forced red)" : "") << std::endl;

    cv::Mat frame;
    while (!stopRequested() && source.read(frame)) {
        processFrame(frame);
        if (annotated && annotated->isOpened() && !last_rendered_.empty()) {
            annotated->write(last_rendered_);
        }
        if (stats_.frames % kProgressEvery == 0) {
            std::cout << "[Pipeline] " << settings_.camera_id << " processed " << stats_.frames << " frames, "
                      << stats_.violations << " violations" << std::endl;
        }
    }

    std::cout << "[Pipeline] " << settings_.camera_id << " finished: " << stats_.frames << " frames, "
              << stats_.violations << " violations, " << stats_.sink_failures << " sink failures, "
              << stats_.profile_errors << " profile errors" << std::endl;
    return stats_;
}

}  // namespace redlight
