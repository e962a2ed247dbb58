#include "../include/ean13/sheet.hpp"
#include "../include/ean13/logger.hpp"

#include <SFML/Graphics.hpp>
#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderTexture.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/System/Vector2.hpp>

#include <format>
#include <stdexcept>

namespace EAN13 {
    namespace {
        fs::path pagePath(const fs::path &out, std::size_t page, std::size_t pages) {
            if (pages == 1) return out;
            fs::path result {out};
            result.replace_filename(std::format("{}-{}{}", out.stem().string(), page + 1, out.extension().string()));
            return result;
        }

        // Bars from the top left corner of the code's quiet zone, label centered below
        void drawCode(sf::RenderTexture &texture, const sf::Font &font, const EncodedCode &code,
            const SheetOptions &options, float x0, float y0)
        {
            const RenderOptions &render {options.render};
            float x {x0 + static_cast<float>(render.quietZone * render.moduleWidth)};
            for (const auto &[bar, width]: code.bars().runs()) {
                const float pixels {static_cast<float>(width * render.moduleWidth)};
                if (bar == Bar::Black) {
                    sf::RectangleShape rect {sf::Vector2f(pixels, static_cast<float>(render.height))};
                    rect.setPosition(x, y0);
                    rect.setFillColor(sf::Color::Black);
                    texture.draw(rect);
                }
                x += pixels;
            }

            const float codeWidth {static_cast<float>((2 * render.quietZone + CODE_WIDTH) * render.moduleWidth)};
            sf::Text label {code.dashed(), font, options.fontSize};
            label.setFillColor(sf::Color::Black);
            label.setPosition(x0 + (codeWidth - label.getLocalBounds().width) / 2,
                y0 + static_cast<float>(render.height) + 4);
            texture.draw(label);
        }
    }

    std::vector<fs::path> renderSheet(const std::vector<EncodedCode> &codes, const fs::path &out, const SheetOptions &options) {
        if (codes.empty()) throw std::invalid_argument("Nothing to render");
        if (options.columns == 0 || options.rows == 0)
            throw std::invalid_argument("Sheet needs at least one row and one column");

        sf::Font font;
        if (!font.loadFromFile(options.font))
            throw std::runtime_error("Failed to load font, please reconfigure: " + options.font);

        const RenderOptions &render {options.render};
        const unsigned cellWidth {(2 * render.quietZone + static_cast<unsigned>(CODE_WIDTH)) * render.moduleWidth};
        const unsigned cellHeight {render.height + options.fontSize + 8};
        const unsigned pageWidth {options.margin + options.columns * (cellWidth + options.margin)};
        const unsigned pageHeight {options.margin + options.rows * (cellHeight + options.margin)};

        const std::size_t perPage {static_cast<std::size_t>(options.columns) * options.rows};
        const std::size_t pages {(codes.size() + perPage - 1) / perPage};

        std::vector<fs::path> written;
        for (std::size_t page {0}; page < pages; page++) {
            sf::RenderTexture texture;
            if (!texture.create(pageWidth, pageHeight))
                throw std::runtime_error(std::format("Unable to create a {}x{} render texture", pageWidth, pageHeight));
            texture.clear(sf::Color::White);

            for (std::size_t slot {0}; slot < perPage && page * perPage + slot < codes.size(); slot++) {
                const std::size_t row {slot / options.columns}, col {slot % options.columns};
                const float x0 {static_cast<float>(options.margin + col * (cellWidth + options.margin))};
                const float y0 {static_cast<float>(options.margin + row * (cellHeight + options.margin))};
                drawCode(texture, font, codes[page * perPage + slot], options, x0, y0);
            }

            // Flush & save to output file
            texture.display();
            sf::Image img {texture.getTexture().copyToImage()};
            fs::path path {pagePath(out, page, pages)};
            if (!img.saveToFile(path.string()))
                throw std::runtime_error("Unable to write PNG page: " + path.string());

            Logging::Dynamic::Info("Wrote page {}/{} to {}", page + 1, pages, path.string());
            written.push_back(path);
        }
        return written;
    }
}
