#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

namespace atclean {

namespace fs = std::filesystem;

using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;

using Mask = uint32_t;
using IndexList = std::vector<size_t>;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Zero point of the uJy flux scale (AB magnitudes)
constexpr double kFluxZeroPoint = 23.9;

// Column names of ATLAS forced photometry tables
namespace col {
constexpr const char* MJD = "MJD";
constexpr const char* MJDBIN = "MJDbin";
constexpr const char* FLUX = "uJy";
constexpr const char* DFLUX = "duJy";
constexpr const char* DFLUX_NEW = "duJy_new";
constexpr const char* CHI_N = "chi/N";
constexpr const char* SNR = "uJy/duJy";
constexpr const char* MASK = "Mask";
constexpr const char* MAG = "m";
constexpr const char* DMAG = "dm";
constexpr const char* STDEV = "stdev";
constexpr const char* X2 = "x2";
constexpr const char* NCLIP = "Nclip";
constexpr const char* NGOOD = "Ngood";
constexpr const char* NEXCLUDED = "Nexcluded";
} // namespace col

// Processing phases
enum class Phase {
    LOAD = 0,
    PREPARE = 1,
    UNCERT_EST = 2,
    UNCERT_CUT = 3,
    X2_CUT = 4,
    CONTROLS_CUT = 5,
    CUSTOM_CUTS = 6,
    AVERAGING = 7,
    SAVE = 8,
    ROLLING_SUM = 9,
    SIMULATION = 10,
    EFFICIENCY = 11,
    DONE = 12
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD: return "LOAD";
        case Phase::PREPARE: return "PREPARE";
        case Phase::UNCERT_EST: return "UNCERT_EST";
        case Phase::UNCERT_CUT: return "UNCERT_CUT";
        case Phase::X2_CUT: return "X2_CUT";
        case Phase::CONTROLS_CUT: return "CONTROLS_CUT";
        case Phase::CUSTOM_CUTS: return "CUSTOM_CUTS";
        case Phase::AVERAGING: return "AVERAGING";
        case Phase::SAVE: return "SAVE";
        case Phase::ROLLING_SUM: return "ROLLING_SUM";
        case Phase::SIMULATION: return "SIMULATION";
        case Phase::EFFICIENCY: return "EFFICIENCY";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

// Policy for day bins without any good measurement
enum class EmptyBinPolicy {
    NO_VALUE,  // bin carries no flux
    ALL_ROWS   // bin carries the average of all (excluded) rows
};

inline std::string empty_bin_policy_to_string(EmptyBinPolicy policy) {
    switch (policy) {
        case EmptyBinPolicy::NO_VALUE: return "no_value";
        case EmptyBinPolicy::ALL_ROWS: return "all_rows";
        default: return "unknown";
    }
}

inline EmptyBinPolicy string_to_empty_bin_policy(const std::string& s) {
    if (s == "all_rows") return EmptyBinPolicy::ALL_ROWS;
    return EmptyBinPolicy::NO_VALUE;
}

// Observing season window [start, end] in MJD, both ends inclusive
struct Season {
    double start = 0.0;
    double end = 0.0;

    bool contains(double mjd) const { return mjd >= start && mjd <= end; }
};

inline bool in_any_season(const std::vector<Season>& seasons, double mjd) {
    for (const auto& s : seasons) {
        if (s.contains(mjd)) return true;
    }
    return false;
}

} // namespace atclean
