#pragma once

#include "encoder.hpp"
#include "render.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace EAN13 {
    // Lay the codes out on PNG pages of columns x rows, each code labelled with
    // its dashed form. Extra pages get a -N suffix, eg: sheet-2.png.
    // Returns the written paths in page order.
    std::vector<fs::path> renderSheet(const std::vector<EncodedCode> &codes, const fs::path &out,
        const SheetOptions &options = {});
}
