#pragma once

#include <optional>

#include "redlight/config.hpp"
#include "redlight/profile_store.hpp"
#include "redlight/types.hpp"

namespace redlight {

// start <= end: night is everything outside [start, end).
// start > end:  night is [start, 24) and [0, end).
bool isNightHour(int hour, int night_start, int night_end);

// base * repeat * school zone * night, rounded to cents. The night test uses
// the local hour of `now`.
double computeFine(const std::optional<ProfileAggregate>& profile,
                   const ZoneFactors& zone,
                   Timestamp now,
                   const FineConfig& config);

double computeFineAtHour(const std::optional<ProfileAggregate>& profile,
                         const ZoneFactors& zone,
                         int local_hour,
                         const FineConfig& config);

}  // namespace redlight
