#include "../include/ean13/config.hpp"
#include "../include/ean13/errors.hpp"
#include "testing.hpp"

#include <fstream>

using namespace EAN13;

int main() {
    Testing::Suite suite {"Config"};

    // Raw INI structure
    {
        IniData data {parseIni(
            "; leading comment\n"
            "[Generator]\n"
            "Prefix = 200\n"
            "database: /tmp/codes.db\n"
            "\n"
            "# another comment\n"
            "[log]\n"
            "level = 3 ; inline\n"
            "name = a;b\n"
        )};
        assert(data.size() == 2);
        assert(data.at("generator").at("prefix") == "200");
        assert(data.at("generator").at("database") == "/tmp/codes.db");
        assert(data.at("log").at("level") == "3");
        assert(data.at("log").at("name") == "a;b");
        suite.pass("parseIni");
    }

    // Syntax errors carry the line number
    {
        assert(Testing::expectThrows<ConfigError>([] { (void) parseIni("[a]\nx = 1\n[a]\n"); }, "Line #3"));
        assert(Testing::expectThrows<ConfigError>([] { (void) parseIni("[a]\nx = 1\nx = 2\n"); }, "Line #3"));
        assert(Testing::expectThrows<ConfigError>([] { (void) parseIni("x = 1\n"); }, "Line #1"));
        assert(Testing::expectThrows<ConfigError>([] { (void) parseIni("[a]\n\njust text\n"); }, "Line #3"));
        assert(Testing::expectThrows<ConfigError>([] { (void) parseIni("[ ]\n"); }, "Line #1"));
        assert(parseIni("").empty());
        suite.pass("Syntax errors");
    }

    // Typed values and defaults
    {
        Config defaults {Config::parse("")};
        assert(defaults.prefix.empty());
        assert(defaults.database == "codes.db");
        assert(!defaults.seed);
        assert(defaults.sheet.render.moduleWidth == 3 && defaults.sheet.render.height == 120);
        assert(defaults.sheet.render.quietZone == 11);
        assert(defaults.sheet.columns == 3 && defaults.sheet.rows == 8);
        assert(defaults.logLevel == Logging::Level::WARN);

        Config config {Config::parse(
            "[generator]\nprefix = 590\ndatabase = labels.db\nseed = 42\n"
            "[render]\nmodule-width = 2\nheight = 60\nquiet-zone = 9\n"
            "[sheet]\ncolumns = 4\nrows = 10\nmargin = 20\nfont-size = 18\nfont = /fonts/mono.ttf\n"
            "[log]\nlevel = 4\n"
        )};
        assert(config.prefix == "590");
        assert(config.database == "labels.db");
        assert(config.seed == 42u);
        assert(config.sheet.render.moduleWidth == 2 && config.sheet.render.height == 60);
        assert(config.sheet.render.quietZone == 9);
        assert(config.sheet.columns == 4 && config.sheet.rows == 10 && config.sheet.margin == 20);
        assert(config.sheet.fontSize == 18 && config.sheet.font == "/fonts/mono.ttf");
        assert(config.logLevel == Logging::Level::DEBUG);

        // The configured level drives the process logger
        assert(Logging::Dynamic::getLogLevel() == Logging::Level::WARN);
        Logging::Dynamic::setLogLevel(config.logLevel);
        assert(Logging::Dynamic::getLogLevel() == Logging::Level::DEBUG);
        Logging::Dynamic::setLogLevel(defaults.logLevel);
        assert(Logging::Dynamic::getLogLevel() == Logging::Level::WARN);
        suite.pass("Config::parse");
    }

    // Value errors name the section and key
    {
        assert(Testing::expectThrows<ConfigError>([] { (void) Config::parse("[colors]\nbar = red\n"); }, "[colors]"));
        assert(Testing::expectThrows<ConfigError>([] { (void) Config::parse("[render]\nwidth = 3\n"); }, "width"));
        assert(Testing::expectThrows<ConfigError>([] { (void) Config::parse("[render]\nheight = tall\n"); }, "height"));
        assert(Testing::expectThrows<ConfigError>([] { (void) Config::parse("[render]\nmodule-width = 0\n"); }, "module-width"));
        assert(Testing::expectThrows<ConfigError>([] { (void) Config::parse("[log]\nlevel = 6\n"); }, "level"));
        assert(Testing::expectThrows<ConfigError>([] { (void) Config::parse("[generator]\nseed = -1\n"); }, "seed"));
        assert(Testing::expectThrows<ConfigError>([] { (void) Config::parse("[generator]\nprefix = 123456789012\n"); }, "prefix"));
        assert(Testing::expectThrows<ConfigError>([] { (void) Config::parse("[generator]\nprefix = 12ab\n"); }, "prefix"));
        suite.pass("Value errors");
    }

    // Files on disk
    {
        const fs::path path {fs::temp_directory_path() / "ean13-config-test.ini"};
        {
            std::ofstream ofs {path};
            ofs << "[generator]\nprefix = 77\n";
        }
        assert(Config::load(path).prefix == "77");
        fs::remove(path);
        assert(Testing::expectThrows<ConfigError>([&path] { (void) Config::load(path); }, "Unable to read"));
        suite.pass("Config::load");
    }

    return suite.done();
}
