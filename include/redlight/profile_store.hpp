#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "redlight/json.hpp"
#include "redlight/types.hpp"

namespace redlight {

struct ProfileAggregate {
    std::string plate;
    int total_violations = 0;
    Timestamp last_violation;
    int points = 0;
    double risk_score = 1.0;
    std::vector<std::string> history;    // violation ids, oldest first
};

class ProfileStoreError : public std::runtime_error {
public:
    ProfileStoreError(const std::string& plate, const std::string& violation_id, const std::string& what)
        : std::runtime_error("profile update for '" + plate + "' (" + violation_id + ") failed: " + what),
          plate_(plate), violation_id_(violation_id) {}

    const std::string& plate() const { return plate_; }
    const std::string& violationId() const { return violation_id_; }

private:
    std::string plate_;
    std::string violation_id_;
};

constexpr int kPointsPerViolation = 3;
constexpr double kInitialRisk = 1.5;
constexpr double kRiskGrowth = 1.1;
constexpr double kMaxRisk = 5.0;

// New plate: count 1, 3 points, risk 1.5. Existing plate: count + 1,
// points + 3, risk * 1.1 capped at 5.0, id appended to the history.
void applyViolation(ProfileAggregate& profile, const std::string& violation_id, Timestamp at);

JsonValue profileToJson(const ProfileAggregate& profile);
ProfileAggregate profileFromJson(const std::string& plate, const JsonValue& node);

class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    virtual std::optional<ProfileAggregate> get(const std::string& plate) const = 0;

    // Throws ProfileStoreError when the aggregate cannot be updated.
    virtual ProfileAggregate upsert(const std::string& plate,
                                    const std::string& violation_id,
                                    Timestamp at = Clock::now()) = 0;
};

/**
 * Process-wide profile table. Upserts for the same plate are serialized on
 * a per-plate mutex; different plates update in parallel. The table can be
 * written to and restored from a JSON document keyed by plate.
 */
class InMemoryProfileStore : public ProfileStore {
public:
    std::optional<ProfileAggregate> get(const std::string& plate) const override;
    ProfileAggregate upsert(const std::string& plate,
                            const std::string& violation_id,
                            Timestamp at = Clock::now()) override;

    std::size_t size() const;

    JsonValue toJson() const;
    void loadJson(const JsonValue& document);

    void save(const std::string& path) const;
    // A missing file leaves the store empty. A malformed one throws JsonError.
    void load(const std::string& path);

private:
    struct Slot {
        std::mutex mutex;
        std::optional<ProfileAggregate> profile;
    };

    std::shared_ptr<Slot> slot(const std::string& plate);
    std::shared_ptr<Slot> findSlot(const std::string& plate) const;

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

}  // namespace redlight
