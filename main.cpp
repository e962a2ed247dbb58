#include "include/ean13/argparse.hpp"
#include "include/ean13/code_generator.hpp"
#include "include/ean13/code_store.hpp"
#include "include/ean13/config.hpp"
#include "include/ean13/encoder.hpp"
#include "include/ean13/errors.hpp"
#include "include/ean13/logger.hpp"
#include "include/ean13/render.hpp"

#include <print>

using namespace EAN13;

namespace {
    // Options every subcommand understands, so they can follow the subcommand name
    void addCommonArguments(argparse::ArgumentParser &parser) {
        parser.addArgument("config", argparse::NAMED).help("INI file with generator & render defaults");
        parser.alias("config", "c");
        parser.addArgument("verbose", argparse::NAMED).implicitValue<short>(4)
            .validate<short>(argparse::validators::between<short>(1, 5))
            .help("Controls logging verbosity (1=ERROR, 2=WARN, 3=INFO, 4=DEBUG, 5=TRACE)");
        parser.alias("verbose", "v");
    }

    void addRenderArguments(argparse::ArgumentParser &parser) {
        parser.addArgument("out", argparse::NAMED).help("Write the bars to this PBM file");
        parser.alias("out", "o");
        parser.addArgument("module-width", argparse::NAMED).scan<int>()
            .validate<int>(argparse::validators::between(1, 64)).help("Pixels per bar");
        parser.addArgument("height", argparse::NAMED).scan<int>()
            .validate<int>(argparse::validators::between(1, 4096)).help("Height of the bars in pixels");
    }

    // File config first, then anything passed on the command line wins
    Config resolveConfig(const argparse::ArgumentParser &root, const argparse::ArgumentParser &command) {
        Config config {};
        if (command.passed("config")) config = Config::load(command.get("config"));
        else if (root.passed("config")) config = Config::load(root.get("config"));

        Logging::Level level {config.logLevel};
        if (command.passed("verbose")) level = static_cast<Logging::Level>(command.get<short>("verbose"));
        else if (root.passed("verbose")) level = static_cast<Logging::Level>(root.get<short>("verbose"));
        Logging::Dynamic::setLogLevel(level);

        if (command.passed("module-width")) config.sheet.render.moduleWidth = static_cast<unsigned>(command.get<int>("module-width"));
        if (command.passed("height")) config.sheet.render.height = static_cast<unsigned>(command.get<int>("height"));
        return config;
    }
}

int main(int argc, char **argv) try {
    argparse::ArgumentParser cli {"cean13"};
    addCommonArguments(cli);
    cli.description("EAN-13 barcode encoder and collision free code generator");
    cli.epilog("Generated codes are recorded in a SQLite database so they are never issued twice.");

    argparse::ArgumentParser &encodeCmd {cli.addSubcommand("encode")};
    encodeCmd.addArgument("value", argparse::POSITIONAL).required().help("12 digit payload or 13 digit code");
    encodeCmd.addArgument("bars", argparse::NAMED).implicitValue(true).defaultValue(false)
        .help("Also print the bars of each element");
    addRenderArguments(encodeCmd);
    addCommonArguments(encodeCmd);
    encodeCmd.description("Compute the check digit and the bars of a code");

    argparse::ArgumentParser &checkCmd {cli.addSubcommand("check")};
    checkCmd.addArgument("value", argparse::POSITIONAL).required().help("13 digit code to validate");
    addCommonArguments(checkCmd);
    checkCmd.description("Validate the check digit of a 13 digit code");

    argparse::ArgumentParser &decodeCmd {cli.addSubcommand("decode")};
    decodeCmd.addArgument("bits", argparse::POSITIONAL).required().help("95 characters of 0 (white) and 1 (black)");
    addCommonArguments(decodeCmd);
    decodeCmd.description("Read a code back from its bars");

    argparse::ArgumentParser &generateCmd {cli.addSubcommand("generate")};
    generateCmd.addArgument("prefix", argparse::NAMED).validate<std::string>(argparse::validators::digits(11))
        .help("Fixed leading digits of the generated codes");
    generateCmd.alias("prefix", "p");
    generateCmd.addArgument("db", argparse::NAMED).help("SQLite database of issued codes");
    generateCmd.alias("db", "d");
    generateCmd.addArgument("count", argparse::NAMED).defaultValue(1)
        .validate<int>(argparse::validators::between(1, 1000000)).help("How many codes to generate");
    generateCmd.alias("count", "n");
    generateCmd.addArgument("seed", argparse::NAMED).scan<long long>()
        .validate<long long>(argparse::validators::between(0LL, 4294967295LL))
        .help("Seed the random first candidates for reproducible runs");
    generateCmd.addArgument("columns", argparse::NAMED).scan<int>()
        .validate<int>(argparse::validators::between(1, 64)).help("Codes per row in the PBM sheet");
    addRenderArguments(generateCmd);
    addCommonArguments(generateCmd);
    generateCmd.description("Issue new codes that are not in the database yet");

    cli.parseArgs(argc, argv);
    argparse::ArgumentParser *command {cli.activeSubcommand()};
    if (!command) {
        std::println("{}", cli.getHelp());
        return 1;
    }

    Config config {resolveConfig(cli, *command)};

    if (command == &encodeCmd) {
        EncodedCode code {encode(Identifier::from(encodeCmd.get("value")))};
        std::println("{}", code.dashed());
        if (encodeCmd.get<bool>("bars")) std::println("{}", code.dashedBars());
        if (encodeCmd.passed("out")) writePBM(code, encodeCmd.get("out"), config.sheet.render);
    }

    else if (command == &checkCmd) {
        // Invalid input is an answer here, not a failure of the tool
        try {
            Identifier id {Identifier::verify(checkCmd.get("value"))};
            std::println("valid {}", id.dashed());
        } catch (const ValidationError &ex) {
            std::println("invalid: {}", ex.what());
            return 1;
        }
    }

    else if (command == &decodeCmd) {
        Identifier id {decode(BitSequence::fromString(decodeCmd.get("bits")))};
        std::println("{}", id.str());
    }

    else if (command == &generateCmd) {
        const std::string prefix {generateCmd.passed("prefix")? generateCmd.get("prefix"): config.prefix};
        const std::string database {generateCmd.passed("db")? generateCmd.get("db"): config.database};
        if (generateCmd.passed("seed")) config.seed = static_cast<std::uint32_t>(generateCmd.get<long long>("seed"));
        if (generateCmd.passed("columns")) config.sheet.columns = static_cast<unsigned>(generateCmd.get<int>("columns"));

        CodeStore store {CodeStore::open(database)};
        CodeGenerator generator {config.seed? CodeGenerator{*config.seed}: CodeGenerator{}};
        std::vector<EncodedCode> codes {issue(store, generator, prefix,
            static_cast<std::size_t>(generateCmd.get<int>("count")))};

        for (const EncodedCode &code: codes) std::println("{}", code.identifier().str());
        if (generateCmd.passed("out"))
            writePBM(rasterize(codes, config.sheet.render, config.sheet.columns), generateCmd.get("out"));
    }
}

catch (std::exception &ex) {
    Logging::Dynamic::Error("{}", ex.what());
    return 1;
}
