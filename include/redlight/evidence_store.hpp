#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "redlight/config.hpp"
#include "redlight/types.hpp"

namespace redlight {

inline constexpr const char* kSnapshotFailed = "Failed to save snapshot";
inline constexpr const char* kClipFailed = "Failed to save clip";

// Persists violation evidence. Both calls return the written path, or
// nullopt when nothing could be written. The violation id keeps evidence of
// vehicles sharing a plate reading and a frame apart.
class EvidenceStore {
public:
    virtual ~EvidenceStore() = default;

    virtual std::optional<std::string> saveSnapshot(const cv::Mat& frame,
                                                    const std::string& plate,
                                                    const std::string& violation_id) = 0;

    virtual std::optional<std::string> saveClip(const std::vector<cv::Mat>& frames,
                                                double fps,
                                                const std::string& plate,
                                                const std::string& violation_id) = 0;
};

// <output_dir>/images/<plate>_<violation id>.jpg and
// <output_dir>/clips/<plate>_<violation id>.mp4
class DiskEvidenceStore : public EvidenceStore {
public:
    explicit DiskEvidenceStore(const EvidenceConfig& config);

    std::optional<std::string> saveSnapshot(const cv::Mat& frame,
                                            const std::string& plate,
                                            const std::string& violation_id) override;

    std::optional<std::string> saveClip(const std::vector<cv::Mat>& frames,
                                        double fps,
                                        const std::string& plate,
                                        const std::string& violation_id) override;

    static std::string evidenceName(const std::string& plate, const std::string& violation_id);

private:
    std::string image_dir_;
    std::string clip_dir_;
};

}  // namespace redlight
