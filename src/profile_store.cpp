#include "redlight/profile_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>

#include "redlight/common.hpp"

namespace redlight {

void applyViolation(ProfileAggregate& profile, const std::string& violation_id, Timestamp at) {
    if (profile.total_violations <= 0) {
        profile.total_violations = 1;
        profile.points = kPointsPerViolation;
        profile.risk_score = kInitialRisk;
    } else {
        profile.total_violations += 1;
        profile.points += kPointsPerViolation;
        profile.risk_score = std::min(kMaxRisk, profile.risk_score * kRiskGrowth);
    }
    profile.history.push_back(violation_id);
    profile.last_violation = at;
}

JsonValue profileToJson(const ProfileAggregate& profile) {
    JsonValue node = makeObject();
    auto& obj = node.asObject();
    obj["total_violations"] = profile.total_violations;
    obj["last_violation"] = formatIsoTimestamp(profile.last_violation);
    obj["points"] = profile.points;
    obj["risk_score"] = profile.risk_score;
    JsonValue history = makeArray();
    for (const auto& id : profile.history) {
        history.asArray().emplace_back(id);
    }
    obj["history"] = history;
    return node;
}

ProfileAggregate profileFromJson(const std::string& plate, const JsonValue& node) {
    ProfileAggregate profile;
    profile.plate = plate;
    profile.total_violations = static_cast<int>(node.getNumber("total_violations", 0));
    profile.points = static_cast<int>(node.getNumber("points", 0));
    profile.risk_score = std::clamp(node.getNumber("risk_score", 1.0), 1.0, kMaxRisk);
    if (auto ts = parseIsoTimestamp(node.getString("last_violation"))) {
        profile.last_violation = *ts;
    }
    if (node.contains("history") && node.at("history").isArray()) {
        for (const auto& id : node.at("history").asArray()) {
            profile.history.push_back(id.asString());
        }
    }
    return profile;
}

std::shared_ptr<InMemoryProfileStore::Slot> InMemoryProfileStore::slot(const std::string& plate) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& entry = slots_[plate];
    if (!entry) {
        entry = std::make_shared<Slot>();
    }
    return entry;
}

std::shared_ptr<InMemoryProfileStore::Slot> InMemoryProfileStore::findSlot(const std::string& plate) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = slots_.find(plate);
    return it == slots_.end() ? nullptr : it->second;
}

std::optional<ProfileAggregate> InMemoryProfileStore::get(const std::string& plate) const {
    auto entry = findSlot(plate);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->profile;
}

ProfileAggregate InMemoryProfileStore::upsert(const std::string& plate,
                                              const std::string& violation_id,
                                              Timestamp at) {
    if (plate.empty()) {
        throw ProfileStoreError(plate, violation_id, "empty plate key");
    }
    auto entry = slot(plate);
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->profile) {
        entry->profile = ProfileAggregate{};
        entry->profile->plate = plate;
    }
    applyViolation(*entry->profile, violation_id, at);
    return *entry->profile;
}

std::size_t InMemoryProfileStore::size() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    std::size_t count = 0;
    for (const auto& kv : slots_) {
        std::lock_guard<std::mutex> slot_lock(kv.second->mutex);
        if (kv.second->profile) ++count;
    }
    return count;
}

JsonValue InMemoryProfileStore::toJson() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    // Sorted by plate so saved files diff cleanly.
    std::map<std::string, JsonValue> sorted;
    for (const auto& kv : slots_) {
        std::lock_guard<std::mutex> slot_lock(kv.second->mutex);
        if (kv.second->profile) {
            sorted.emplace(kv.first, profileToJson(*kv.second->profile));
        }
    }
    JsonValue profiles = makeObject();
    for (auto& kv : sorted) {
        profiles.asObject()[kv.first] = std::move(kv.second);
    }
    JsonValue document = makeObject();
    document.asObject()["profiles"] = profiles;
    return document;
}

void InMemoryProfileStore::loadJson(const JsonValue& document) {
    if (!document.isObject() || !document.contains("profiles") || !document.at("profiles").isObject()) {
        throw JsonError("profile document must contain a 'profiles' object");
    }
    std::unordered_map<std::string, std::shared_ptr<Slot>> loaded;
    for (const auto& kv : document.at("profiles").asObject()) {
        auto entry = std::make_shared<Slot>();
        entry->profile = profileFromJson(kv.first, kv.second);
        loaded.emplace(kv.first, std::move(entry));
    }
    std::lock_guard<std::mutex> lock(table_mutex_);
    slots_ = std::move(loaded);
}

void InMemoryProfileStore::save(const std::string& path) const {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open profile file for writing: " + path);
    }
    out << toJson().dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("Failed to write profile file: " + path);
    }
}

void InMemoryProfileStore::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[Profiles] No profile file at " << path << ", starting empty" << std::endl;
        return;
    }
    loadJson(parseJsonFile(path));
    std::cout << "[Profiles] Loaded " << size() << " profiles from " << path << std::endl;
}

}  // namespace redlight
