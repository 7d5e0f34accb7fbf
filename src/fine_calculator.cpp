#include "redlight/fine_calculator.hpp"

#include <algorithm>

#include "redlight/common.hpp"

namespace redlight {

bool isNightHour(int hour, int night_start, int night_end) {
    if (night_start <= night_end) {
        return !(night_start <= hour && hour < night_end);
    }
    return hour >= night_start || hour < night_end;
}

double computeFineAtHour(const std::optional<ProfileAggregate>& profile,
                         const ZoneFactors& zone,
                         int local_hour,
                         const FineConfig& config) {
    double amount = config.base_fine;

    if (profile && profile->total_violations > 0) {
        const double multiplier =
            std::max(1.0, 1.0 + profile->total_violations * (config.repeat_multiplier - 1.0));
        amount *= multiplier;
    }
    if (zone.is_school_zone) {
        amount *= config.school_zone_factor;
    }
    if (isNightHour(local_hour, config.night_start, config.night_end)) {
        amount *= config.night_factor;
    }
    return roundDecimal(amount, 2);
}

double computeFine(const std::optional<ProfileAggregate>& profile,
                   const ZoneFactors& zone,
                   Timestamp now,
                   const FineConfig& config) {
    return computeFineAtHour(profile, zone, localHourOfDay(now), config);
}

}  // namespace redlight
