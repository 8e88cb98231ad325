#include "pc/core/util/MaskStack.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "pc/core/util/Errors.hpp"
#include "pc/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace pc {

std::vector<fs::path> listMaskSlices(const fs::path& dir)
{
    if (!fs::is_directory(dir)) {
        throw InputError("mask directory not found: " + dir.string());
    }

    static const std::set<std::string> extensions{".png", ".tif", ".tiff", ".bmp", ".jpg", ".jpeg"};
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (extensions.contains(ext)) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
    return files;
}

Volume loadMaskStack(const fs::path& dir, bool invert)
{
    const auto files = listMaskSlices(dir);
    if (files.empty()) {
        throw InputError("no mask slices found in " + dir.string());
    }

    Volume volume;
    int rows = 0;
    int cols = 0;
    for (std::size_t z = 0; z < files.size(); ++z) {
        cv::Mat img = cv::imread(files[z].string(), cv::IMREAD_GRAYSCALE);
        if (img.empty()) {
            throw InputError("cannot read mask slice: " + files[z].string());
        }
        if (z == 0) {
            rows = img.rows;
            cols = img.cols;
            volume = Volume::from_shape({files.size(), static_cast<std::size_t>(rows),
                                         static_cast<std::size_t>(cols)});
        } else if (img.rows != rows || img.cols != cols) {
            throw InputError("slice " + files[z].filename().string() + " is " +
                             std::to_string(img.cols) + "x" + std::to_string(img.rows) +
                             ", expected " + std::to_string(cols) + "x" + std::to_string(rows));
        }

        for (int y = 0; y < rows; ++y) {
            const uint8_t* row = img.ptr<uint8_t>(y);
            for (int x = 0; x < cols; ++x) {
                const bool fg = row[x] > 0;
                volume(z, y, x) = (fg != invert) ? 1 : 0;
            }
        }
    }

    Logger()->info("Loaded mask stack {}: {} slices of {}x{}{}", dir.string(), files.size(), cols, rows,
                   invert ? " (inverted)" : "");
    return volume;
}

void saveMaskStack(const Volume& volume, const fs::path& dir)
{
    fs::create_directories(dir);
    const Shape3 s = shapeOf(volume);
    for (std::size_t z = 0; z < s[0]; ++z) {
        cv::Mat img(static_cast<int>(s[1]), static_cast<int>(s[2]), CV_8UC1);
        for (int y = 0; y < img.rows; ++y) {
            uint8_t* row = img.ptr<uint8_t>(y);
            for (int x = 0; x < img.cols; ++x) {
                row[x] = volume(z, y, x) ? 255 : 0;
            }
        }
        char name[32];
        std::snprintf(name, sizeof(name), "slice_%05zu.png", z);
        if (!cv::imwrite((dir / name).string(), img)) {
            throw std::runtime_error("failed to write " + (dir / name).string());
        }
    }
}

}  // namespace pc
