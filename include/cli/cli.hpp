#pragma once

#include "core/errors.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tg {

/// Process exit codes, one per failure family
enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitConfig = 2,
    kExitCorpus = 3,
    kExitEmbeddingSpace = 4,
    kExitEmbedding = 5,
    kExitFailure = 6
};

// Value of one option as given on the command line (or its declared default)
struct ArgValue {
    std::string value;
    bool is_set = false;

    size_t as_size(size_t default_val = 0) const {
        if (!is_set) return default_val;
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument("expected a non-negative integer, got '" + value + "'");
        }
        size_t pos = 0;
        unsigned long parsed = 0;
        try {
            parsed = std::stoul(value, &pos);
        } catch (const std::exception&) {
            throw std::invalid_argument("expected a non-negative integer, got '" + value + "'");
        }
        if (pos != value.size()) {
            throw std::invalid_argument("expected a non-negative integer, got '" + value + "'");
        }
        return static_cast<size_t>(parsed);
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        size_t pos = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(value, &pos);
        } catch (const std::exception&) {
            throw std::invalid_argument("expected a number, got '" + value + "'");
        }
        if (pos != value.size()) {
            throw std::invalid_argument("expected a number, got '" + value + "'");
        }
        return parsed;
    }

    bool as_flag() const {
        return is_set && value != "false" && value != "0";
    }

    // Delimited term list; surrounding spaces trimmed, empty items dropped
    std::vector<std::string> as_list(char delim = ',') const {
        std::vector<std::string> items;
        if (!is_set) return items;

        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, delim)) {
            auto begin = item.find_first_not_of(' ');
            if (begin == std::string::npos) continue;
            auto end = item.find_last_not_of(' ');
            items.push_back(item.substr(begin, end - begin + 1));
        }
        return items;
    }
};

// Parsed options of one command invocation
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;

    ArgValue get(const std::string& name, const std::string& fallback = "") const {
        auto it = named.find(name);
        if (it != named.end() && it->second.is_set) return it->second;
        return ArgValue{fallback, !fallback.empty()};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        if (!has(name)) {
            throw std::invalid_argument("missing required option --" + name);
        }
        return named.at(name).value;
    }
};

// One accepted option
struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;       // Presence alone sets it
};

// One subcommand: its options and the handler that runs it
struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program) const {
        std::cout << "\nUsage: " << program << " " << name;
        for (const auto& arg : args) {
            if (arg.required) std::cout << " --" << arg.name << " <value>";
        }
        std::cout << " [options]\n\n" << description << "\n\nOptions:\n";

        for (const auto& arg : args) {
            std::string flag = "--" + arg.name;
            if (!arg.short_name.empty()) flag += ", -" + arg.short_name;
            if (!arg.is_flag) flag += " <value>";

            std::cout << "  " << flag << "\n      " << arg.description;
            if (!arg.default_value.empty()) std::cout << " (default: " << arg.default_value << ")";
            if (arg.required) std::cout << " [required]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

/**
 * @brief Subcommand dispatcher for the termguide tool
 *
 * Handlers throw on failure; run() maps the error family onto an ExitCode
 * and prints a one-line message.
 */
class CLI {
public:
    CLI(std::string program_name, std::string version)
        : program_name_(std::move(program_name)), version_(std::move(version)) {}

    void register_command(Command cmd) {
        order_.push_back(cmd.name);
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return kExitUsage;
        }

        std::string cmd_name = argv[1];
        if (cmd_name == "--help" || cmd_name == "-h" || cmd_name == "help") {
            print_help();
            return kExitOk;
        }
        if (cmd_name == "--version") {
            std::cout << program_name_ << " " << version_ << "\n";
            return kExitOk;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n"
                      << "Run '" << program_name_ << " --help' for available commands.\n";
            return kExitUsage;
        }
        const Command& cmd = it->second;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_);
                return kExitOk;
            }
        }

        Args args;
        try {
            args = parse_args(argc - 2, argv + 2, cmd);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd.print_help(program_name_);
            return kExitUsage;
        }

        try {
            return cmd.handler(args);
        } catch (const ConfigError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return kExitConfig;
        } catch (const CorpusError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return kExitCorpus;
        } catch (const EmbeddingSpaceMismatch& e) {
            std::cerr << "Error: " << e.what() << "\n"
                      << "Rebuild the index with '" << program_name_ << " build --force'.\n";
            return kExitEmbeddingSpace;
        } catch (const EmbeddingError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return kExitEmbedding;
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return kExitUsage;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return kExitFailure;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - terminology guidance for translation prompts\n\n"
                  << "Usage: " << program_name_ << " <command> [options]\n\nCommands:\n";
        for (const auto& name : order_) {
            std::string padded = name;
            padded.resize(std::max<size_t>(name.size() + 2, 12), ' ');
            std::cout << "  " << padded << commands_.at(name).description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command options.\n"
                  << "Version: " << version_ << "\n";
    }

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;

    // Accepts --name value, --name=value and -s value; a repeated option
    // is joined with commas so list options can be given several times
    static Args parse_args(int argc, char** argv, const Command& cmd) {
        std::map<std::string, const ArgDef*> lookup;
        for (const auto& def : cmd.args) {
            lookup["--" + def.name] = &def;
            if (!def.short_name.empty()) lookup["-" + def.short_name] = &def;
        }

        Args result;
        for (int i = 0; i < argc; ++i) {
            std::string token = argv[i];
            if (token.size() < 2 || token[0] != '-') {
                result.positional.push_back(token);
                continue;
            }

            std::string key = token;
            std::string inline_value;
            bool has_inline = false;
            auto eq = token.find('=');
            if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
                key = token.substr(0, eq);
                inline_value = token.substr(eq + 1);
                has_inline = true;
            }

            auto it = lookup.find(key);
            if (it == lookup.end()) {
                throw std::invalid_argument("unknown option " + key);
            }
            const ArgDef& def = *it->second;

            std::string value;
            if (def.is_flag) {
                value = has_inline ? inline_value : "true";
            } else if (has_inline) {
                value = inline_value;
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                throw std::invalid_argument("option " + key + " needs a value");
            }

            ArgValue& slot = result.named[def.name];
            if (slot.is_set && !def.is_flag) {
                slot.value += "," + value;
            } else {
                slot = ArgValue{value, true};
            }
        }

        for (const auto& def : cmd.args) {
            if (result.has(def.name)) continue;
            if (def.required) {
                throw std::invalid_argument("missing required option --" + def.name);
            }
            if (!def.default_value.empty()) {
                result.named[def.name] = ArgValue{def.default_value, true};
            }
        }
        return result;
    }
};

} // namespace tg
