#pragma once

#include "encoder.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace EAN13 {
    struct RenderOptions {
        unsigned moduleWidth {3};   // pixels per bar
        unsigned height {120};      // pixel rows of the bars
        unsigned quietZone {11};    // white modules on each side
    };

    struct SheetOptions {
        RenderOptions render {};
        unsigned columns {3}, rows {8};
        unsigned margin {40};       // pixels around the page and between codes
        unsigned fontSize {22};
        std::string font {"/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf"};
    };

    // Packed 1 bit per pixel rows, 1 is black as in PBM
    struct Bitmap {
        std::size_t width {}, height {};
        std::vector<unsigned char> rows;

        bool at(std::size_t x, std::size_t y) const;
    };

    // Bars of one code including its quiet zones
    [[nodiscard]] Bitmap rasterize(const EncodedCode &code, const RenderOptions &options = {});

    // Codes tiled left to right, top to bottom, `columns` per row
    [[nodiscard]] Bitmap rasterize(const std::vector<EncodedCode> &codes, const RenderOptions &options, unsigned columns);

    // Binary (P4) PBM writers
    void writePBM(const Bitmap &bitmap, const fs::path &path);
    void writePBM(const EncodedCode &code, const fs::path &path, const RenderOptions &options = {});
}
