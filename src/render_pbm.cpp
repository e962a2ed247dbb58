#include "../include/ean13/render.hpp"
#include "../include/ean13/logger.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace EAN13 {
    namespace {
        std::size_t rowBytes(std::size_t width) { return (width + 7) / 8; }

        Bitmap blank(std::size_t width, std::size_t height) {
            return Bitmap{width, height, std::vector<unsigned char>(rowBytes(width) * height, 0)};
        }

        std::size_t codeWidth(const RenderOptions &options) {
            return (2 * options.quietZone + CODE_WIDTH) * options.moduleWidth;
        }

        // Paint every black run as a filled rectangle, (x0, y0) is the top left of the quiet zone
        void drawCode(Bitmap &bitmap, const EncodedCode &code, const RenderOptions &options, std::size_t x0, std::size_t y0) {
            std::size_t x {x0 + options.quietZone * options.moduleWidth};
            for (const auto &[bar, width]: code.bars().runs()) {
                const std::size_t pixels {width * options.moduleWidth};
                if (bar == Bar::Black) {
                    for (std::size_t y {y0}; y < y0 + options.height; y++) {
                        unsigned char *row {bitmap.rows.data() + y * rowBytes(bitmap.width)};
                        for (std::size_t px {x}; px < x + pixels; px++)
                            row[px / 8] |= static_cast<unsigned char>(0x80 >> (px % 8));
                    }
                }
                x += pixels;
            }
        }

        void checkOptions(const RenderOptions &options) {
            if (options.moduleWidth == 0 || options.height == 0)
                throw std::invalid_argument("Module width and height must be positive");
        }
    }

    bool Bitmap::at(std::size_t x, std::size_t y) const {
        if (x >= width || y >= height) throw std::out_of_range("Pixel outside of bitmap");
        return rows[y * rowBytes(width) + x / 8] & (0x80 >> (x % 8));
    }

    Bitmap rasterize(const EncodedCode &code, const RenderOptions &options) {
        checkOptions(options);
        Bitmap bitmap {blank(codeWidth(options), options.height)};
        drawCode(bitmap, code, options, 0, 0);
        return bitmap;
    }

    Bitmap rasterize(const std::vector<EncodedCode> &codes, const RenderOptions &options, unsigned columns) {
        checkOptions(options);
        if (columns == 0) throw std::invalid_argument("Sheet needs at least one column");
        if (codes.empty()) throw std::invalid_argument("Nothing to render");

        const std::size_t cellWidth {codeWidth(options)};
        const std::size_t gap {options.quietZone * options.moduleWidth};
        const std::size_t cols {std::min<std::size_t>(columns, codes.size())};
        const std::size_t lines {(codes.size() + columns - 1) / columns};

        Bitmap bitmap {blank(cols * cellWidth, lines * options.height + (lines - 1) * gap)};
        for (std::size_t i {0}; i < codes.size(); i++) {
            std::size_t row {i / columns}, col {i % columns};
            drawCode(bitmap, codes[i], options, col * cellWidth, row * (options.height + gap));
        }
        return bitmap;
    }

    void writePBM(const Bitmap &bitmap, const fs::path &path) {
        std::ofstream ofs {path, std::ios::binary};
        if (!ofs) throw std::runtime_error("Unable to write PBM file: " + path.string());

        ofs << "P4\n" << bitmap.width << " " << bitmap.height << "\n";
        ofs.write(reinterpret_cast<const char*>(bitmap.rows.data()), static_cast<std::streamsize>(bitmap.rows.size()));
        if (!ofs) throw std::runtime_error("Failed writing PBM file: " + path.string());
        Logging::Dynamic::Debug("Wrote {}x{} PBM to {}", bitmap.width, bitmap.height, path.string());
    }

    void writePBM(const EncodedCode &code, const fs::path &path, const RenderOptions &options) {
        writePBM(rasterize(code, options), path);
    }
}
