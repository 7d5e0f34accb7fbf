#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>

#include "redlight/common.hpp"
#include "redlight/pipeline.hpp"

using namespace redlight;

namespace {

// Replays one list of boxes per frame; an empty script frame means no vehicles.
class ScriptedTracker : public Tracker {
public:
    void script(std::vector<TrackedBox> boxes) { frames_.push_back(std::move(boxes)); }
    void failNext() { fail_next_ = true; }

    std::vector<TrackedBox> update(const cv::Mat&) override {
        if (fail_next_) {
            fail_next_ = false;
            throw std::runtime_error("detector crashed");
        }
        if (frames_.empty()) return {};
        auto boxes = frames_.front();
        frames_.pop_front();
        return boxes;
    }

private:
    std::deque<std::vector<TrackedBox>> frames_;
    bool fail_next_ = false;
};

class FakeOcr : public OcrEngine {
public:
    std::optional<OcrReading> reading{OcrReading{"ab-123", 0.9}};
    int calls = 0;

    std::optional<OcrReading> read(const cv::Mat&) override {
        ++calls;
        return reading;
    }
    std::string name() const override { return "fake"; }
};

class FakeEvidence : public EvidenceStore {
public:
    bool fail = false;
    std::size_t last_clip_frames = 0;

    std::optional<std::string> saveSnapshot(const cv::Mat&, const std::string& plate,
                                            const std::string& violation_id) override {
        if (fail) return std::nullopt;
        return "images/" + DiskEvidenceStore::evidenceName(plate, violation_id) + ".jpg";
    }

    std::optional<std::string> saveClip(const std::vector<cv::Mat>& frames, double, const std::string& plate,
                                        const std::string& violation_id) override {
        last_clip_frames = frames.size();
        if (fail) throw std::runtime_error("disk full");
        return "clips/" + DiskEvidenceStore::evidenceName(plate, violation_id) + ".mp4";
    }
};

class RecordingSink : public ViolationSink {
public:
    bool accept = true;
    std::vector<ViolationRecord> records;

    bool submit(const ViolationRecord& record) override {
        records.push_back(record);
        return accept;
    }
};

class FailingProfileStore : public ProfileStore {
public:
    std::optional<ProfileAggregate> get(const std::string&) const override { return std::nullopt; }
    ProfileAggregate upsert(const std::string& plate, const std::string& violation_id, Timestamp) override {
        throw ProfileStoreError(plate, violation_id, "store offline");
    }
};

class FakeFrameSource : public FrameSource {
public:
    explicit FakeFrameSource(int frames) : remaining_(frames) {}

    bool read(cv::Mat& frame) override {
        if (remaining_ <= 0) return false;
        --remaining_;
        frame = cv::Mat(720, 1280, CV_8UC3, cv::Scalar(40, 40, 40));
        return true;
    }
    double fps() const override { return 30.0; }
    cv::Size frameSize() const override { return cv::Size(1280, 720); }

    int remaining() const { return remaining_; }

private:
    int remaining_;
};

TrackedBox before(int id) { return TrackedBox{id, BoundingBox{100, 400, 200, 490}}; }
TrackedBox past(int id) { return TrackedBox{id, BoundingBox{100, 415, 200, 505}}; }

class PipelineTest : public ::testing::Test {
protected:
    cv::Mat frame{720, 1280, CV_8UC3, cv::Scalar(40, 40, 40)};
    Timestamp start = makeLocalTimestamp(2024, 1, 1, 12, 0, 0);

    ScriptedTracker tracker;
    FakeOcr ocr;
    FakeEvidence evidence;
    InMemoryProfileStore profiles;
    RecordingSink sink;

    ViolationPipeline makePipeline(bool force_red = true, ProfileStore* store = nullptr) {
        PipelineSettings settings;
        settings.camera_id = "cam1";
        settings.location_id = "LOC_1";
        settings.stop_line = StopLine{Point{0, 500}, Point{1280, 500}};
        return ViolationPipeline(settings, FrameTimeline(start, 30.0, {}, force_red),
                                 PipelineServices{tracker, ocr, evidence, store ? *store : profiles, sink});
    }
};

}  // namespace

TEST_F(PipelineTest, CrossingDuringRedProducesOneRecord) {
    auto pipeline = makePipeline();
    tracker.script({before(7)});
    tracker.script({past(7)});

    EXPECT_TRUE(pipeline.processFrame(frame).records.empty());
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 1u);
    const auto& record = report.records.front();
    EXPECT_EQ(record.track_id, 7);
    EXPECT_EQ(record.frame_index, 1);
    EXPECT_EQ(record.vehicle_plate, "AB123");
    EXPECT_DOUBLE_EQ(record.ocr_confidence, 0.9);
    EXPECT_DOUBLE_EQ(record.fine_amount, 100.0);
    EXPECT_EQ(record.image_path, "images/AB123_" + record.id + ".jpg");
    EXPECT_EQ(record.video_clip_path, "clips/AB123_" + record.id + ".mp4");
    EXPECT_EQ(record.location_id, "LOC_1");
    EXPECT_EQ(record.violation_type, "Red_Light_Crossing");
    EXPECT_EQ(record.id, pipeline.makeViolationId(1, 7));
    EXPECT_EQ(record.timestamp, pipeline.timeline().timestampAt(1));

    ASSERT_EQ(sink.records.size(), 1u);
    EXPECT_EQ(sink.records.front().id, record.id);
    EXPECT_EQ(pipeline.detector().phase(7), TrackPhase::Logged);

    const auto profile = profiles.get("AB123");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->total_violations, 1);
    EXPECT_EQ(profile->history, std::vector<std::string>{record.id});
}

TEST_F(PipelineTest, OscillatingTrackIsReportedOnce) {
    auto pipeline = makePipeline();
    tracker.script({before(7)});
    tracker.script({past(7)});
    tracker.script({before(7)});
    tracker.script({past(7)});
    tracker.script({before(7)});
    tracker.script({past(7)});

    std::size_t total = 0;
    for (int i = 0; i < 6; ++i) {
        total += pipeline.processFrame(frame).records.size();
    }
    EXPECT_EQ(total, 1u);
    EXPECT_EQ(sink.records.size(), 1u);
    EXPECT_EQ(pipeline.stats().violations, 1);
}

TEST_F(PipelineTest, CrossingWhileGreenIsIgnored) {
    auto pipeline = makePipeline(false);
    tracker.script({before(3)});
    tracker.script({past(3)});

    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);
    EXPECT_FALSE(report.is_red);
    EXPECT_TRUE(report.records.empty());
    EXPECT_EQ(report.observations.size(), 1u);
    EXPECT_EQ(ocr.calls, 0);
    EXPECT_NE(pipeline.detector().phase(3), TrackPhase::Logged);
}

TEST_F(PipelineTest, UnreadPlateIsRecordedUnderUnknownProfile) {
    ocr.reading.reset();
    auto pipeline = makePipeline();
    tracker.script({before(4)});
    tracker.script({past(4)});

    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_EQ(report.records.front().vehicle_plate, "UNKNOWN");
    EXPECT_DOUBLE_EQ(report.records.front().ocr_confidence, 0.0);
    EXPECT_DOUBLE_EQ(report.records.front().fine_amount, 100.0);

    const auto unknown = profiles.get("UNKNOWN");
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ(unknown->total_violations, 1);
    EXPECT_EQ(unknown->history, std::vector<std::string>{report.records.front().id});
}

TEST_F(PipelineTest, UnknownPlateHistoryRaisesLaterFines) {
    ocr.reading.reset();
    profiles.upsert("UNKNOWN", "earlier-1", start);

    auto pipeline = makePipeline();
    tracker.script({before(4)});
    tracker.script({past(4)});
    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_DOUBLE_EQ(report.records.front().fine_amount, 150.0);
    EXPECT_EQ(profiles.get("UNKNOWN")->total_violations, 2);
}

TEST_F(PipelineTest, OcrConfidenceIsRoundedToThreeDecimals) {
    ocr.reading = OcrReading{"XY9", 0.87654};
    auto pipeline = makePipeline();
    tracker.script({before(4)});
    tracker.script({past(4)});
    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_DOUBLE_EQ(report.records.front().ocr_confidence, 0.877);
}

TEST_F(PipelineTest, RepeatOffenderPaysMore) {
    profiles.upsert("AB123", "earlier-1", start);
    profiles.upsert("AB123", "earlier-2", start);

    auto pipeline = makePipeline();
    tracker.script({before(9)});
    tracker.script({past(9)});
    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_DOUBLE_EQ(report.records.front().fine_amount, 200.0);
    EXPECT_EQ(profiles.get("AB123")->total_violations, 3);
}

TEST_F(PipelineTest, EvidenceFailuresUseSentinels) {
    evidence.fail = true;
    auto pipeline = makePipeline();
    tracker.script({before(5)});
    tracker.script({past(5)});
    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_EQ(report.records.front().image_path, "Failed to save snapshot");
    EXPECT_EQ(report.records.front().video_clip_path, "Failed to save clip");
    EXPECT_EQ(sink.records.size(), 1u);
}

TEST_F(PipelineTest, ClipCoversRetainedFramesAroundCrossing) {
    auto pipeline = makePipeline();
    for (int i = 0; i < 10; ++i) tracker.script({});
    tracker.script({before(2)});
    tracker.script({past(2)});
    for (int i = 0; i < 12; ++i) pipeline.processFrame(frame);

    // Frames 0..11 are retained; the crossing is frame 11 with 45 frames either side.
    EXPECT_EQ(evidence.last_clip_frames, 12u);
}

TEST_F(PipelineTest, RejectedSubmissionIsCounted) {
    sink.accept = false;
    auto pipeline = makePipeline();
    tracker.script({before(6)});
    tracker.script({past(6)});
    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    EXPECT_EQ(report.records.size(), 1u);
    EXPECT_EQ(report.sink_failures, 1);
    EXPECT_EQ(pipeline.stats().sink_failures, 1);
    EXPECT_EQ(sink.records.size(), 1u);
}

TEST_F(PipelineTest, ProfileFailureIsReportedWithoutLosingRecord) {
    FailingProfileStore failing;
    auto pipeline = makePipeline(true, &failing);
    tracker.script({before(8)});
    tracker.script({past(8)});
    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 1u);
    ASSERT_EQ(report.profile_errors.size(), 1u);
    EXPECT_EQ(report.profile_errors.front().plate, "AB123");
    EXPECT_EQ(report.profile_errors.front().violation_id, report.records.front().id);
    EXPECT_EQ(pipeline.stats().profile_errors, 1);
    EXPECT_EQ(sink.records.size(), 1u);
}

TEST_F(PipelineTest, TrackerFailureStillAdvancesFrame) {
    auto pipeline = makePipeline();
    tracker.failNext();
    const auto report = pipeline.processFrame(frame);

    EXPECT_EQ(report.frame_index, 0);
    EXPECT_TRUE(report.observations.empty());
    EXPECT_TRUE(pipeline.window().contains(0));
    EXPECT_FALSE(pipeline.lastRendered().empty());
    EXPECT_EQ(pipeline.nextFrameIndex(), 1);
}

TEST_F(PipelineTest, SeveralTracksCrossingInOneFrame) {
    auto pipeline = makePipeline();
    tracker.script({before(1), TrackedBox{2, BoundingBox{600, 400, 700, 495}}});
    tracker.script({past(1), TrackedBox{2, BoundingBox{600, 420, 700, 510}}});
    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 2u);
    EXPECT_NE(report.records[0].id, report.records[1].id);
}

TEST_F(PipelineTest, SamePlateInOneFrameGetsSeparateEvidence) {
    ocr.reading.reset();
    auto pipeline = makePipeline();
    tracker.script({before(1), TrackedBox{2, BoundingBox{600, 400, 700, 495}}});
    tracker.script({past(1), TrackedBox{2, BoundingBox{600, 420, 700, 510}}});
    pipeline.processFrame(frame);
    const auto report = pipeline.processFrame(frame);

    ASSERT_EQ(report.records.size(), 2u);
    EXPECT_EQ(report.records[0].vehicle_plate, report.records[1].vehicle_plate);
    EXPECT_EQ(report.records[0].timestamp, report.records[1].timestamp);
    EXPECT_NE(report.records[0].image_path, report.records[1].image_path);
    EXPECT_NE(report.records[0].video_clip_path, report.records[1].video_clip_path);
    EXPECT_EQ(profiles.get("UNKNOWN")->total_violations, 2);
}

TEST_F(PipelineTest, RunConsumesSourceUntilExhausted) {
    auto pipeline = makePipeline();
    FakeFrameSource source(5);
    const auto stats = pipeline.run(source);
    EXPECT_EQ(stats.frames, 5);
    EXPECT_EQ(source.remaining(), 0);
}

TEST_F(PipelineTest, RunHonoursStopRequest) {
    auto pipeline = makePipeline();
    pipeline.requestStop();
    FakeFrameSource source(5);
    const auto stats = pipeline.run(source);
    EXPECT_EQ(stats.frames, 0);
    EXPECT_EQ(source.remaining(), 5);
}
