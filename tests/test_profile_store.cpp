#include <gtest/gtest.h>

#include <filesystem>
#include <thread>
#include <vector>

#include "redlight/profile_store.hpp"

using redlight::InMemoryProfileStore;
using redlight::ProfileAggregate;

TEST(ProfileStore, FirstViolationCreatesProfile) {
    InMemoryProfileStore store;
    EXPECT_FALSE(store.get("ABC123").has_value());

    const auto profile = store.upsert("ABC123", "v1");
    EXPECT_EQ(profile.plate, "ABC123");
    EXPECT_EQ(profile.total_violations, 1);
    EXPECT_EQ(profile.points, 3);
    EXPECT_DOUBLE_EQ(profile.risk_score, 1.5);
    EXPECT_EQ(profile.history, std::vector<std::string>{"v1"});

    const auto stored = store.get("ABC123");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->total_violations, 1);
}

TEST(ProfileStore, RiskGrowsByTenPercentAndCapsAtFive) {
    InMemoryProfileStore store;
    store.upsert("P", "v1");
    EXPECT_NEAR(store.upsert("P", "v2").risk_score, 1.65, 1e-9);
    EXPECT_NEAR(store.upsert("P", "v3").risk_score, 1.815, 1e-9);

    double previous = store.get("P")->risk_score;
    for (int i = 4; i <= 40; ++i) {
        const double risk = store.upsert("P", "v" + std::to_string(i)).risk_score;
        EXPECT_GE(risk, previous);
        EXPECT_LE(risk, 5.0);
        previous = risk;
    }
    const auto profile = store.get("P");
    EXPECT_DOUBLE_EQ(profile->risk_score, 5.0);
    EXPECT_EQ(profile->total_violations, 40);
    EXPECT_EQ(profile->points, 120);
    ASSERT_EQ(profile->history.size(), 40u);
    EXPECT_EQ(profile->history.front(), "v1");
    EXPECT_EQ(profile->history.back(), "v40");
}

TEST(ProfileStore, ApplyViolationInitialisesMissingHistory) {
    ProfileAggregate profile;
    profile.total_violations = 2;
    profile.risk_score = 1.65;
    redlight::applyViolation(profile, "late", redlight::Clock::now());
    EXPECT_EQ(profile.history, std::vector<std::string>{"late"});
    EXPECT_EQ(profile.total_violations, 3);
}

TEST(ProfileStore, ZeroCountKeepsExistingHistory) {
    ProfileAggregate profile;
    profile.history = {"restored"};
    redlight::applyViolation(profile, "next", redlight::Clock::now());
    EXPECT_EQ(profile.history, (std::vector<std::string>{"restored", "next"}));
    EXPECT_EQ(profile.total_violations, 1);
    EXPECT_DOUBLE_EQ(profile.risk_score, redlight::kInitialRisk);
}

TEST(ProfileStore, LoadedRiskIsClampedToValidRange) {
    const auto low = redlight::profileFromJson("AB1", redlight::parseJson(R"({"risk_score": 0.2})"));
    EXPECT_DOUBLE_EQ(low.risk_score, 1.0);
    const auto high = redlight::profileFromJson("AB1", redlight::parseJson(R"({"risk_score": 9.0})"));
    EXPECT_DOUBLE_EQ(high.risk_score, redlight::kMaxRisk);
}

TEST(ProfileStore, ConcurrentUpsertsOnOnePlateAreNotLost) {
    InMemoryProfileStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < kPerThread; ++i) {
                store.upsert("SHARED1", "t" + std::to_string(t) + "_" + std::to_string(i));
                store.upsert("OWN" + std::to_string(t), "x");
            }
        });
    }
    for (auto& thread : threads) thread.join();

    const auto shared = store.get("SHARED1");
    ASSERT_TRUE(shared.has_value());
    EXPECT_EQ(shared->total_violations, kThreads * kPerThread);
    EXPECT_EQ(shared->points, 3 * kThreads * kPerThread);
    EXPECT_EQ(shared->history.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_DOUBLE_EQ(shared->risk_score, 5.0);
    EXPECT_EQ(store.size(), static_cast<std::size_t>(kThreads + 1));
}

TEST(ProfileStore, EmptyPlateIsRejected) {
    InMemoryProfileStore store;
    EXPECT_THROW(store.upsert("", "v1"), redlight::ProfileStoreError);
}

TEST(ProfileStore, SavesAndRestoresProfiles) {
    const auto path = (std::filesystem::temp_directory_path() / "redlight_profiles_test" / "profiles.json").string();
    std::filesystem::remove_all(std::filesystem::path(path).parent_path());

    const auto when = redlight::Clock::from_time_t(1704067200);
    {
        InMemoryProfileStore store;
        store.upsert("ABC123", "v1", when);
        store.upsert("ABC123", "v2", when);
        store.upsert("XYZ9", "v3", when);
        store.save(path);
    }

    InMemoryProfileStore restored;
    restored.load(path);
    EXPECT_EQ(restored.size(), 2u);
    const auto profile = restored.get("ABC123");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->total_violations, 2);
    EXPECT_EQ(profile->points, 6);
    EXPECT_NEAR(profile->risk_score, 1.65, 1e-9);
    EXPECT_EQ(profile->history, (std::vector<std::string>{"v1", "v2"}));
    EXPECT_EQ(profile->last_violation, when);

    EXPECT_NEAR(restored.upsert("ABC123", "v4").risk_score, 1.815, 1e-9);

    std::filesystem::remove_all(std::filesystem::path(path).parent_path());
}

TEST(ProfileStore, LoadingMissingFileLeavesStoreEmpty) {
    InMemoryProfileStore store;
    store.load("/nonexistent/redlight/profiles.json");
    EXPECT_EQ(store.size(), 0u);
}

TEST(ProfileStore, MalformedDocumentIsRejected) {
    InMemoryProfileStore store;
    EXPECT_THROW(store.loadJson(redlight::parseJson(R"({"drivers": []})")), redlight::JsonError);
}
