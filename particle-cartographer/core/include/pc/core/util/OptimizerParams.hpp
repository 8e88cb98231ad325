#pragma once

#include <filesystem>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "pc/core/types/Volume.hpp"
#include "pc/core/util/GuardVolume.hpp"
#include "pc/core/util/ParticleSplit.hpp"
#include "pc/core/util/RadiusSelect.hpp"

namespace pc {

// Everything one optimization run depends on, passed by value into the run
struct OptimizerParams {
    std::vector<int> radii{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    SplitParams split;
    Connectivity contactConnectivity = Connectivity::Corner;
    GuardParams guard;
    SelectionPolicy selection;

    bool computeContacts = true;
    bool retainBestLabels = true;
    int autoExcludeThreshold = 200;

    /**
     * @brief Reject unusable settings before any radius is processed
     * @throws InputError
     */
    void validate() const;
};

// Ascending radii r_min..r_max inclusive. Throws InputError if r_min > r_max.
std::vector<int> radiusRange(int rMin, int rMax);

/**
 * @brief Build parameters from a configuration object
 *
 * Every key is optional. "radii" takes precedence over "r_min"/"r_max".
 * @throws InputError for malformed values
 */
OptimizerParams optimizerParamsFromJson(const nlohmann::json& json);

// Read a configuration file and validate it. Throws InputError for invalid settings.
OptimizerParams loadOptimizerParams(const std::filesystem::path& path);

nlohmann::json toJson(const OptimizerParams& params);

}  // namespace pc
