#include "pc/core/util/OptimizerParams.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/LoadJson.hpp"
#include "pc/core/util/Logging.hpp"

namespace pc {

static constexpr int kMaxReasonableRadius = 15;

void OptimizerParams::validate() const
{
    if (radii.empty()) {
        throw InputError("radius candidate list is empty");
    }
    for (const int r : radii) {
        if (r < 0) {
            throw InputError("radius candidates must be >= 0, got " + std::to_string(r));
        }
    }
    if (std::adjacent_find(radii.begin(), radii.end(),
                           [](int a, int b) { return a >= b; }) != radii.end()) {
        throw InputError("radius candidates must be strictly ascending");
    }
    if (autoExcludeThreshold < 0) {
        throw InputError("auto exclude threshold must be >= 0");
    }
    if (guard.marginScale < 0.0 || guard.minMarginVoxels < 0 ||
        guard.maxMarginFraction < 0.0 || guard.maxMarginFraction >= 0.5) {
        throw InputError("guard policy needs margin_scale >= 0, min_margin >= 0 and "
                         "max_margin_fraction in [0, 0.5)");
    }
    selection.validate();

    if (radii.back() > kMaxReasonableRadius) {
        Logger()->warn("Largest radius candidate {} exceeds {}; small particles will vanish",
                       radii.back(), kMaxReasonableRadius);
    }
}

std::vector<int> radiusRange(int rMin, int rMax)
{
    if (rMin > rMax) {
        throw InputError("r_min " + std::to_string(rMin) + " exceeds r_max " + std::to_string(rMax));
    }
    std::vector<int> out;
    for (int r = rMin; r <= rMax; ++r) {
        out.push_back(r);
    }
    return out;
}

static Connectivity connectivityOr(const nlohmann::json* m, const char* key, Connectivity def)
{
    return connectivityFromInt(json::int_or(m, key, toInt(def)));
}

OptimizerParams optimizerParamsFromJson(const nlohmann::json& j)
{
    if (!j.is_object()) {
        throw InputError("optimizer configuration must be a JSON object");
    }

    OptimizerParams p;
    const nlohmann::json* m = &j;

    try {
        if (j.contains("radii")) {
            p.radii = json::int_array_or(m, "radii", p.radii);
        } else if (j.contains("r_min") || j.contains("r_max")) {
            const int rMin = json::int_or(m, "r_min", p.radii.front());
            const int rMax = json::int_or(m, "r_max", p.radii.back());
            p.radii = radiusRange(rMin, rMax);
        }
    } catch (const std::runtime_error& e) {
        throw InputError(e.what());
    }

    p.split.seedConnectivity = connectivityOr(m, "seed_connectivity", p.split.seedConnectivity);
    p.split.floodConnectivity = connectivityOr(m, "flood_connectivity", p.split.floodConnectivity);
    p.contactConnectivity = connectivityOr(m, "contact_connectivity", p.contactConnectivity);

    p.selection.tauRatio = json::number_or(m, "tau_ratio", p.selection.tauRatio);
    p.selection.contactsMin = json::number_or(m, "contacts_min", p.selection.contactsMin);
    p.selection.contactsMax = json::number_or(m, "contacts_max", p.selection.contactsMax);
    p.selection.smoothingWindow = json::int_or(m, "smoothing_window", p.selection.smoothingWindow);
    p.selection.targetContacts = json::number_or(m, "target_contacts", p.selection.targetContacts);

    if (const nlohmann::json* g = json::object_or_null(m, "guard")) {
        p.guard.marginScale = json::number_or(g, "margin_scale", p.guard.marginScale);
        p.guard.minMarginVoxels = json::int_or(g, "min_margin", p.guard.minMarginVoxels);
        p.guard.maxMarginFraction = json::number_or(g, "max_margin_fraction", p.guard.maxMarginFraction);
    }

    p.computeContacts = json::bool_or(m, "compute_contacts", p.computeContacts);
    p.retainBestLabels = json::bool_or(m, "retain_best_labels", p.retainBestLabels);
    p.autoExcludeThreshold = json::int_or(m, "auto_exclude_threshold", p.autoExcludeThreshold);

    return p;
}

OptimizerParams loadOptimizerParams(const std::filesystem::path& path)
{
    OptimizerParams p = optimizerParamsFromJson(json::load_json_file(path));
    p.validate();
    Logger()->info("Loaded optimizer configuration from {}", path.string());
    return p;
}

nlohmann::json toJson(const OptimizerParams& p)
{
    nlohmann::json j;
    j["radii"] = p.radii;
    j["seed_connectivity"] = toInt(p.split.seedConnectivity);
    j["flood_connectivity"] = toInt(p.split.floodConnectivity);
    j["contact_connectivity"] = toInt(p.contactConnectivity);
    j["tau_ratio"] = p.selection.tauRatio;
    j["contacts_min"] = p.selection.contactsMin;
    j["contacts_max"] = p.selection.contactsMax;
    j["smoothing_window"] = p.selection.smoothingWindow;
    j["target_contacts"] = p.selection.targetContacts;
    j["guard"] = {
        {"margin_scale", p.guard.marginScale},
        {"min_margin", p.guard.minMarginVoxels},
        {"max_margin_fraction", p.guard.maxMarginFraction},
    };
    j["compute_contacts"] = p.computeContacts;
    j["retain_best_labels"] = p.retainBestLabels;
    j["auto_exclude_threshold"] = p.autoExcludeThreshold;
    return j;
}

}  // namespace pc
