#pragma once

#include <algorithm>
#include <charconv>
#include <concepts>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <variant>
#include <vector>

// Command line parsing for the cean13 tools: named (--key value, --key=value),
// aliased (-k value) and positional arguments plus nested subcommands
namespace EAN13::argparse {
    enum ARGTYPE { POSITIONAL, NAMED, BOTH };

    using VALUE_TYPE = std::variant<bool, short, int, long, long long, double, std::string>;

    template<typename T>
    concept ValidValueType =
    std::same_as<T,   bool> || std::same_as<T,     short> ||
    std::same_as<T,    int> || std::same_as<T,      long> ||
    std::same_as<T, double> || std::same_as<T, long long> ||
    std::same_as<T, std::string>;

    inline std::ostream &operator<<(std::ostream &oss, const VALUE_TYPE &val) {
        std::visit([&oss](const auto &arg) { oss << arg; }, val);
        return oss;
    }

    namespace validators {
        template<typename T>
        std::function<bool(const T&)> between(T min, T max) {
            return [min, max](const T &val) { return val >= min && val <= max; };
        }

        // Decimal digit strings of at most `maxLength` characters
        inline std::function<bool(const std::string&)> digits(std::size_t maxLength) {
            return [maxLength](const std::string &val) {
                return val.size() <= maxLength && std::ranges::all_of(val, [](char ch) { return ch >= '0' && ch <= '9'; });
            };
        }
    }

    class Argument {
        private:
            const std::string _name;
            const ARGTYPE _type;
            bool _required {false}, _valueSet {false};
            bool _typeSet {false}, _defaultValueSet {false};
            std::string _alias, _helpStr;
            VALUE_TYPE _value;
            std::optional<VALUE_TYPE> _default, _implicit;
            std::function<bool(const VALUE_TYPE&)> _validator;

            void checkValue() const {
                if (_validator && !_validator(_value)) {
                    std::ostringstream oss; oss << _value;
                    throw std::runtime_error("Argparse Error: Invalid value passed to '" + _name + "': " + oss.str());
                }
            }

        public:
            Argument(const std::string &name, const ARGTYPE &type = ARGTYPE::BOTH):
                _name(name), _type(type), _value("")
            {
                if (name.empty())
                    throw std::runtime_error("Argparse Error: Argument name cannot be empty");
                else if (name.starts_with('-') || name.find('=') != std::string::npos)
                    throw std::runtime_error("Argparse Error: Invalid parameter name: " + name);
            }

            bool           ok() const { return !_required || _valueSet || _defaultValueSet; }
            bool   isOptional() const { return !_required || _defaultValueSet; }
            bool   isValueSet() const { return _valueSet; }

            const std::string &getName() const { return _name; }
            ARGTYPE getArgType() const { return _type; }

            template<typename T>
            T get() const {
                if (!_valueSet && !_defaultValueSet)
                    throw std::runtime_error("Argparse Error: Argument '" + _name + "' was not set");
                else if (!std::holds_alternative<T>(_value))
                    throw std::runtime_error("Argparse Error: Type mismatch (get): " + _name);
                return std::get<T>(_value);
            }

            std::string getHelp(const int width = 15) const {
                std::ostringstream oss, part;
                part << "--" << _name;
                if (!_alias.empty()) part << ", -" << _alias;

                oss << std::left << std::setw(width) << part.str() << "\t" << _helpStr;
                if (_required) oss << " (REQUIRED)";
                if (_implicit.has_value()) oss << " (implicit=" << *_implicit << ")";
                if (_defaultValueSet) oss << " (default=" << *_default << ")";
                return oss.str();
            }

            Argument &alias(const std::string &name) {
                if (_type == ARGTYPE::POSITIONAL)
                    throw std::runtime_error("Argparse Error: Alias being set for a positional argument: " + _name);
                _alias = name; return *this;
            }

            Argument &required() { _required = true; return *this; }

            Argument &help(const std::string &msg) { _helpStr = msg; return *this; }

            // Flag style use, eg: `--bars` with no value
            Argument &set() {
                if (!_implicit.has_value())
                    throw std::runtime_error("Argparse Error: No value passed for: " + _name);
                _value = *_implicit; _valueSet = true; return *this;
            }

            Argument &set(const std::string &val) {
                std::visit([&](auto &arg) {
                    using T = std::decay_t<decltype(arg)>;
                    arg = parse<T>(val);
                }, _value);
                checkValue();
                _typeSet = true; _valueSet = true; return *this;
            }

            template <ValidValueType T>
            Argument &scan() {
                if (_typeSet && !std::holds_alternative<T>(_value))
                    throw std::runtime_error("Argparse Error: Type mismatch (scan): " + _name);
                _typeSet = true; _value = T{}; return *this;
            }

            template<ValidValueType T>
            Argument &defaultValue(const T &val) {
                if (_typeSet && !std::holds_alternative<T>(_value))
                    throw std::runtime_error("Argparse Error: Type mismatch (default): " + _name);
                _defaultValueSet = true; _typeSet = true;
                _default = _value = val; return *this;
            }

            template<ValidValueType T>
            Argument &implicitValue(const T &val) {
                if (_typeSet && !std::holds_alternative<T>(_value))
                    throw std::runtime_error("Argparse Error: Type mismatch (implicit): " + _name);
                _typeSet = true; _implicit = val;
                if (!_defaultValueSet) _value = T{};
                return *this;
            }

            Argument  &defaultValue(const char *val) { return  defaultValue<std::string>(val); }
            Argument &implicitValue(const char *val) { return implicitValue<std::string>(val); }

            // Checked on every explicitly passed value, defaults are trusted
            template<ValidValueType T>
            Argument &validate(std::function<bool(const T&)> check) {
                if (_typeSet && !std::holds_alternative<T>(_value))
                    throw std::runtime_error("Argparse Error: Type mismatch (validate): " + _name);
                if (!_typeSet) { _value = T{}; _typeSet = true; }
                _validator = [check = std::move(check)](const VALUE_TYPE &val) {
                    return std::holds_alternative<T>(val) && check(std::get<T>(val));
                };
                return *this;
            }

            template<typename T>
            T parse(const std::string &arg) const {
                if constexpr (std::is_same_v<T, bool>) {
                    return arg != "" && arg != "0" && arg != "false";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return arg;
                } else {
                    T placeholder {};
                    std::from_chars_result parseResult {std::from_chars(arg.c_str(), arg.c_str() + arg.size(), placeholder)};
                    if (parseResult.ec != std::errc() || parseResult.ptr != arg.c_str() + arg.size())
                        throw std::runtime_error("Argparse Error: Invalid value passed to '" + _name + "': " + arg);
                    return placeholder;
                }
            }
    };

    class ArgumentParser {
        private:
            int maxArgLen {15}, maxSubCmdLen {15};
            std::string name, helpArgName;
            std::optional<std::string> _description, _epilog;
            std::unordered_map<std::string, Argument> allArgs;
            std::vector<std::string> positionalOrder;
            std::unordered_map<std::string, std::string> aliasedArgs;
            std::unordered_map<std::string, ArgumentParser> subcommands;

            // Set once parseArgs reached this parser, tells subcommands apart
            bool touched {false};

            static std::pair<std::string, std::string> splitArg(const std::string &arg) {
                std::size_t pos {arg.find('=')};
                if (pos == std::string::npos) return {arg, ""};
                return {arg.substr(0, pos), arg.substr(pos + 1)};
            }

            Argument &named(const std::string &key) {
                auto it {allArgs.find(key)};
                if (it == allArgs.end() || it->second.getArgType() == ARGTYPE::POSITIONAL)
                    throw std::runtime_error("Argparse Error: Unknown named argument passed: " + key);
                return it->second;
            }

            Argument &aliased(const std::string &alias) {
                auto it {aliasedArgs.find(alias)};
                if (it == aliasedArgs.end())
                    throw std::runtime_error("Argparse Error: Unknown aliased argument passed: " + alias);
                return allArgs.at(it->second);
            }

            // Consume the next token as value unless it looks like an option
            // A flag right before a subcommand name takes its implicit value, eg: `-v encode`
            void assign(Argument &arg, const std::vector<std::string> &argVec, std::size_t &i) const {
                if (i == argVec.size() - 1 || argVec[i + 1].starts_with('-') || subcommands.contains(argVec[i + 1])) arg.set();
                else arg.set(argVec[++i]);
            }

        public:
            ArgumentParser(const std::string &name, const std::string &helpArgName = "help"):
                name(name), helpArgName(helpArgName)
            {
                if (helpArgName.empty())
                    throw std::runtime_error("Argparse Error: Help Argument name cannot be empty");
                addArgument(helpArgName, ARGTYPE::NAMED).help("Display this help text and exit")
                    .implicitValue(true).defaultValue(false);
            }

            // Name of the first unsatisfied argument, empty if all are fine
            std::string check() const {
                for (const auto &[_, arg]: allArgs)
                    if (!arg.ok()) return arg.getName();
                return "";
            }

            ArgumentParser &description(const std::string &message) { _description = message; return *this; }
            ArgumentParser &epilog(const std::string &message) { _epilog = message; return *this; }

            template<ValidValueType T=std::string>
            T get(const std::string &key) const {
                auto it {allArgs.find(key)};
                if (it == allArgs.end())
                    throw std::runtime_error("Argparse Error: Argument with name '" + key + "' does not exist");
                return it->second.get<T>();
            }

            // Explicitly passed on the command line
            bool passed(const std::string &key) const noexcept {
                auto it {allArgs.find(key)};
                return it != allArgs.end() && it->second.isValueSet();
            }

            void parseArgs(int argc, char **argv, std::size_t parseStartIdx = 0) {
                touched = true;
                const std::vector<std::string> argVec {argv, argv + argc};

                std::size_t position {0}; bool positionalOnly {false};
                for (std::size_t i {parseStartIdx + 1}; i < argVec.size(); i++) {
                    std::string arg {argVec[i]};

                    if (arg == "--") {
                        positionalOnly = true;
                    }

                    // "--count=12" (or) "--count 12"
                    else if (!positionalOnly && arg.starts_with("--")) {
                        auto [key, value] {splitArg(arg.substr(2))};
                        Argument &target {named(key)};
                        if (!value.empty()) target.set(value);
                        else assign(target, argVec, i);
                    }

                    // "-n 12"
                    else if (!positionalOnly && arg.starts_with('-') && arg.size() > 1) {
                        assign(aliased(arg.substr(1)), argVec, i);
                    }

                    // Hand over the rest to the subcommand, parent is not validated
                    else if (!positionalOnly && subcommands.contains(arg)) {
                        subcommands.at(arg).parseArgs(argc, argv, i);
                        return;
                    }

                    else {
                        positionalOnly = true;
                        while (position < positionalOrder.size() && allArgs.at(positionalOrder[position]).isValueSet())
                            position++;
                        if (position >= positionalOrder.size())
                            throw std::runtime_error("Argparse Error: Unknown positional argument passed: " + arg);
                        allArgs.at(positionalOrder[position++]).set(arg);
                    }

                    if (allArgs.at(helpArgName).get<bool>()) {
                        std::cout << getHelp() << '\n';
                        std::exit(0);
                    }
                }

                const std::string missingArg {check()};
                if (!missingArg.empty())
                    throw std::runtime_error("Argparse Error: Missing value for argument: " + missingArg);
            }

            Argument &addArgument(const std::string &argName, const ARGTYPE &type = ARGTYPE::BOTH) {
                if (allArgs.contains(argName))
                    throw std::runtime_error("Argparse Error: Duplicate argument with name: " + argName);
                if (subcommands.contains(argName))
                    throw std::runtime_error("Argparse Error: Argument name conflicts with subcommand: " + argName);

                // Positionals are filled in the order they were declared
                if (type != ARGTYPE::NAMED) positionalOrder.push_back(argName);
                maxArgLen = std::max(maxArgLen, static_cast<int>(argName.size() + 10));
                return allArgs.emplace(argName, Argument{argName, type}).first->second;
            }

            // Aliases are registered after the argument is fully declared
            ArgumentParser &alias(const std::string &argName, const std::string &aliasName) {
                allArgs.at(argName).alias(aliasName);
                auto [_, inserted] {aliasedArgs.try_emplace(aliasName, argName)};
                if (!inserted)
                    throw std::runtime_error("Argparse Error: Duplicate argument with alias: " + aliasName);
                return *this;
            }

            ArgumentParser &addSubcommand(const std::string &cmdName) {
                if (allArgs.contains(cmdName))
                    throw std::runtime_error("Argparse Error: Subcommand conflict with argument: " + cmdName);
                if (subcommands.contains(cmdName))
                    throw std::runtime_error("Argparse Error: Duplicate subcommand with name: " + cmdName);

                maxSubCmdLen = std::max(maxSubCmdLen, static_cast<int>(cmdName.size() + 10));
                return subcommands.emplace(cmdName, ArgumentParser{cmdName, helpArgName}).first->second;
            }

            // First subcommand that was reached while parsing, nullptr if none
            ArgumentParser *activeSubcommand() {
                for (auto &[_, command]: subcommands)
                    if (command.touched) return &command;
                return nullptr;
            }

            const std::string &getName() const { return name; }

            std::string getHelp() const {
                std::ostringstream oss;
                oss << "Usage: " << name << " [OPTIONS] ";

                std::ostringstream subcommandsHelp; std::string subcommandsAvailable;
                for (const auto &[_, command]: subcommands) {
                    subcommandsAvailable += command.name + ',';
                    subcommandsHelp << ' ' << std::left << std::setw(maxSubCmdLen) << command.name << "\t"
                        << command._description.value_or("The '" + command.name + "' subcommand") << '\n';
                }
                if (!subcommands.empty()) {
                    subcommandsAvailable.pop_back();
                    oss << '{' << subcommandsAvailable << "} ";
                }

                for (const std::string &argName: positionalOrder)
                    oss << (allArgs.at(argName).isOptional()? '[' + argName + ']': argName) << ' ';

                if (_description) oss << "\n\n" << *_description;
                if (!subcommands.empty()) oss << "\n\nSubcommands:\n" << subcommandsHelp.str();

                oss << "\n\nArguments:\n";
                for (const auto &[_, arg]: allArgs)
                    oss << " " << arg.getHelp(maxArgLen) << '\n';

                if (_epilog) oss << "\n" << *_epilog << '\n';
                return oss.str();
            }
    };
}
