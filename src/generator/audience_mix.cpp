/// @file src/generator/audience_mix.cpp
/// @brief Deterministic audience composition snapshot per hour.

#include "adsim/generator.hpp"
#include "adsim/temporal.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cmath>
#include <string>
#include <string_view>

namespace adsim {

namespace {

constexpr std::array<std::string_view, 3> kDeviceLabels{"CTV", "DESKTOP", "MOBILE"};
constexpr std::array<std::string_view, 6> kAgeLabels{"18-24", "25-34", "35-44",
                                                     "45-54", "55-64", "65+"};
constexpr std::array<std::string_view, 2> kGenderLabels{"F", "M"};
constexpr std::array<std::string_view, 3> kLifeStageLabels{"SINGLE", "PARENT", "EMPTY_NEST"};
constexpr std::array<std::string_view, 5> kInterestLabels{"SPORTS", "ENTERTAINMENT", "FOOD",
                                                          "TECH", "TRAVEL"};

/// Scale a share vector so it sums to 1. A zero vector is returned as-is.
template <int N>
[[nodiscard]] Eigen::Vector<double, N> normalized(const Eigen::Vector<double, N>& v) noexcept {
    const double total = v.sum();
    if (total <= 0.0) return v;
    return v / total;
}

/// Label → share object for one dimension, shares rounded to four places.
template <int N>
[[nodiscard]] nlohmann::json share_object(const std::array<std::string_view, N>& labels,
                                          const Eigen::Vector<double, N>& shares) {
    nlohmann::json group = nlohmann::json::object();
    for (int i = 0; i < N; ++i) {
        group[std::string{labels[static_cast<std::size_t>(i)]}] =
            std::round(shares(i) * 1e4) / 1e4;
    }
    return group;
}

}  // namespace

// ─── AudienceMix::to_json ─────────────────────────────────────────────────────

std::string AudienceMix::to_json() const {
    nlohmann::json j;
    j["device"]     = share_object<3>(kDeviceLabels, device);
    j["age"]        = share_object<6>(kAgeLabels, age);
    j["gender"]     = share_object<2>(kGenderLabels, gender);
    j["life_stage"] = share_object<3>(kLifeStageLabels, life_stage);
    j["interest"]   = share_object<5>(kInterestLabels, interest);
    return j.dump();
}

// ─── FunnelGenerator::audience_mix ────────────────────────────────────────────

AudienceMix generator::FunnelGenerator::audience_mix(HourTs hour) noexcept {
    const bool weekend = temporal::day_of_week(hour) >= 5;
    const bool leisure = weekend || temporal::is_evening(hour);

    AudienceMix mix;
    mix.device = normalized<3>(leisure
        ? DeviceShares(0.45, 0.20, 0.35)
        : DeviceShares(0.30, 0.30, 0.40));

    AgeShares age;
    age << (leisure ? 0.16 : 0.12), 0.24, 0.22, 0.18, 0.13, 0.07;
    mix.age = normalized<6>(age);

    mix.gender     = GenderShares(0.5, 0.5);
    mix.life_stage = LifeStageShares(0.35, 0.40, 0.25);

    InterestShares interest;
    interest << 0.20, 0.30, 0.20, 0.15, 0.15;
    mix.interest = interest;
    return mix;
}

}  // namespace adsim
