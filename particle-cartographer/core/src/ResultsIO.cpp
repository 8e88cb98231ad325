#include "pc/core/util/ResultsIO.hpp"

#include <bit>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "pc/core/util/LoadJson.hpp"
#include "pc/core/util/Logging.hpp"
#include "pc/core/util/ParticleMetrics.hpp"

namespace fs = std::filesystem;

namespace pc {

static std::ofstream openForWrite(const fs::path& path)
{
    std::ofstream o(path);
    if (!o) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    return o;
}

void writeResultsCsv(const OptimizationSummary& summary, const fs::path& path)
{
    auto o = openForWrite(path);
    o << "radius,particle_count,mean_contacts,median_contacts,max_contacts,largest_particle_ratio,"
         "hhi,vi_to_previous,processing_time,total_volume,largest_particle_volume,"
         "interior_particle_count,excluded_particle_count,guard_margin\n";
    o << std::setprecision(10);
    for (const auto& r : summary.results) {
        o << r.radius << ',' << r.particleCount << ',' << r.meanContacts << ',' << r.medianContacts << ','
          << r.maxContacts << ',' << r.largestParticleRatio << ',' << r.hhi << ',' << r.viToPrevious << ','
          << r.processingTime << ',' << r.totalVolume << ',' << r.largestParticleVolume << ','
          << r.interiorParticleCount << ',' << r.excludedParticleCount << ',' << r.guardMargin << '\n';
    }
}

nlohmann::json summaryToJson(const OptimizationSummary& summary, const OptimizerParams& params)
{
    nlohmann::json j;
    j["best_radius"] = summary.bestRadius;
    j["optimization_method"] = toString(summary.method);
    j["reason"] = summary.reason;
    j["explanation"] = summary.explanation;
    j["total_processing_time"] = summary.totalProcessingTime;
    j["parameters"] = toJson(params);

    auto results = nlohmann::json::array();
    for (const auto& r : summary.results) {
        results.push_back({
            {"radius", r.radius},
            {"particle_count", r.particleCount},
            {"mean_contacts", r.meanContacts},
            {"median_contacts", r.medianContacts},
            {"max_contacts", r.maxContacts},
            {"largest_particle_ratio", r.largestParticleRatio},
            {"hhi", r.hhi},
            {"vi_to_previous", r.viToPrevious},
            {"processing_time", r.processingTime},
            {"total_volume", r.totalVolume},
            {"largest_particle_volume", r.largestParticleVolume},
            {"interior_particle_count", r.interiorParticleCount},
            {"excluded_particle_count", r.excludedParticleCount},
            {"guard_margin", r.guardMargin},
        });
    }
    j["results"] = results;
    return j;
}

void writeContactsCsv(const ContactAnalysis& analysis, const fs::path& path)
{
    auto o = openForWrite(path);
    o << "particle_id,contacts\n";
    for (const auto id : analysis.partition.interior) {
        o << id << ',' << analysis.contacts.count(id) << '\n';
    }
}

void writeLabelVolume(const LabelVolume& labels, const fs::path& dir, const std::string& stem)
{
    const fs::path rawPath = dir / (stem + ".raw");
    std::ofstream raw(rawPath, std::ios::binary);
    if (!raw) {
        throw std::runtime_error("Cannot write " + rawPath.string());
    }

    if constexpr (std::endian::native == std::endian::little) {
        raw.write(reinterpret_cast<const char*>(labels.data()),
                  static_cast<std::streamsize>(labels.size() * sizeof(uint32_t)));
    } else {
        for (const auto v : labels) {
            const uint8_t b[4] = {uint8_t(v), uint8_t(v >> 8), uint8_t(v >> 16), uint8_t(v >> 24)};
            raw.write(reinterpret_cast<const char*>(b), 4);
        }
    }
    if (!raw) {
        throw std::runtime_error("Failed writing " + rawPath.string());
    }

    const Shape3 s = shapeOf(labels);
    nlohmann::json meta;
    meta["shape"] = {s[0], s[1], s[2]};
    meta["dtype"] = "uint32";
    meta["byte_order"] = "little";
    meta["order"] = "zyx";
    json::save_json_file(meta, dir / (stem + ".json"));
}

LabelVolume readLabelVolume(const fs::path& dir, const std::string& stem)
{
    const fs::path metaPath = dir / (stem + ".json");
    const nlohmann::json meta = json::load_json_file(metaPath);
    json::require_fields(meta, {"shape", "dtype"}, metaPath.string());
    if (meta["dtype"] != "uint32") {
        throw std::runtime_error(metaPath.string() + " has dtype " + meta["dtype"].dump() + ", expected uint32");
    }
    const auto shape = meta["shape"].get<std::vector<std::size_t>>();
    if (shape.size() != 3) {
        throw std::runtime_error(metaPath.string() + " shape must have three entries");
    }

    LabelVolume labels = LabelVolume::from_shape({shape[0], shape[1], shape[2]});
    const fs::path rawPath = dir / (stem + ".raw");
    const auto expected = labels.size() * sizeof(uint32_t);
    if (!fs::exists(rawPath) || fs::file_size(rawPath) != expected) {
        throw std::runtime_error(rawPath.string() + " does not hold " + std::to_string(expected) + " bytes");
    }

    std::ifstream raw(rawPath, std::ios::binary);
    std::vector<uint8_t> bytes(expected);
    raw.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(expected));
    if (!raw) {
        throw std::runtime_error("Failed reading " + rawPath.string());
    }
    uint32_t* dst = labels.data();
    for (std::size_t i = 0; i < labels.size(); ++i) {
        const uint8_t* b = &bytes[i * 4];
        dst[i] = uint32_t(b[0]) | (uint32_t(b[1]) << 8) | (uint32_t(b[2]) << 16) | (uint32_t(b[3]) << 24);
    }
    return labels;
}

void exportResults(const OptimizationSummary& summary, const OptimizerParams& params, const fs::path& dir)
{
    fs::create_directories(dir);
    writeResultsCsv(summary, dir / "optimization_results.csv");
    json::save_json_file(summaryToJson(summary, params), dir / "optimization_summary.json");

    if (summary.bestLabels) {
        const LabelVolume& best = *summary.bestLabels;
        writeLabelVolume(best, dir, "best_labels");
        if (params.computeContacts) {
            const ContactAnalysis analysis = analyzeContacts(best, computeParticleStats(best), params);
            writeContactsCsv(analysis, dir / "contact_counts.csv");
        }
    }
    Logger()->info("Results written to {}", dir.string());
}

}  // namespace pc
