#include "include/ean13/argparse.hpp"
#include "include/ean13/code_generator.hpp"
#include "include/ean13/code_store.hpp"
#include "include/ean13/config.hpp"
#include "include/ean13/logger.hpp"
#include "include/ean13/sheet.hpp"

#include <print>

using namespace EAN13;

int main(int argc, char **argv) try {
    argparse::ArgumentParser parser {"cean13-sheet"};
    parser.description("Issue new EAN-13 codes and print them on PNG label sheets");
    parser.addArgument("out", argparse::POSITIONAL).required().help("PNG file of the first page");
    parser.addArgument("prefix", argparse::NAMED).validate<std::string>(argparse::validators::digits(11))
        .help("Fixed leading digits of the generated codes");
    parser.alias("prefix", "p");
    parser.addArgument("db", argparse::NAMED).help("SQLite database of issued codes");
    parser.alias("db", "d");
    parser.addArgument("count", argparse::NAMED).scan<int>()
        .validate<int>(argparse::validators::between(1, 100000)).help("How many codes, defaults to one full page");
    parser.alias("count", "n");
    parser.addArgument("config", argparse::NAMED).help("INI file with generator & sheet defaults");
    parser.alias("config", "c");
    parser.addArgument("verbose", argparse::NAMED).implicitValue<short>(4)
        .validate<short>(argparse::validators::between<short>(1, 5))
        .help("Controls logging verbosity (1=ERROR, 2=WARN, 3=INFO, 4=DEBUG, 5=TRACE)");
    parser.alias("verbose", "v");
    parser.parseArgs(argc, argv);

    Config config {parser.passed("config")? Config::load(parser.get("config")): Config{}};
    Logging::Dynamic::setLogLevel(parser.passed("verbose")?
        static_cast<Logging::Level>(parser.get<short>("verbose")): config.logLevel);

    const std::string prefix {parser.passed("prefix")? parser.get("prefix"): config.prefix};
    const std::string database {parser.passed("db")? parser.get("db"): config.database};
    const std::size_t count {parser.passed("count")? static_cast<std::size_t>(parser.get<int>("count")):
        static_cast<std::size_t>(config.sheet.columns) * config.sheet.rows};

    CodeStore store {CodeStore::open(database)};
    CodeGenerator generator {config.seed? CodeGenerator{*config.seed}: CodeGenerator{}};
    std::vector<EncodedCode> codes {issue(store, generator, prefix, count)};

    for (const fs::path &page: renderSheet(codes, parser.get("out"), config.sheet))
        std::println("{}", page.string());
}

catch (std::exception &ex) {
    Logging::Dynamic::Error("{}", ex.what());
    return 1;
}
