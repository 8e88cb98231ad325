#pragma once

#include <filesystem>
#include <vector>

#include "pc/core/types/Volume.hpp"

namespace pc {

// Image files of a directory that can hold a binarized slice, sorted by file name
std::vector<std::filesystem::path> listMaskSlices(const std::filesystem::path& dir);

/**
 * @brief Stack binarized slices into a volume (one slice per z)
 *
 * Slices are read as 8-bit grayscale; any value > 0 is foreground.
 *
 * @param invert Treat zero pixels as foreground instead
 * @throws InputError if the directory has no slices, a slice cannot be read,
 *         or slice sizes differ
 */
Volume loadMaskStack(const std::filesystem::path& dir, bool invert = false);

// Write one PNG per z slice (0 / 255), named slice_00000.png ...
void saveMaskStack(const Volume& volume, const std::filesystem::path& dir);

}  // namespace pc
