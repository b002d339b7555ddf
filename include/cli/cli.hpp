#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <functional>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <cstdint>

namespace amod {

// Value of one command-line option; numeric accessors reject trailing text
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }

    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        return parse<int>(value, "an integer", [](const std::string& s, size_t* used) {
            return std::stoi(s, used);
        });
    }

    // Non-negative count such as a module target
    size_t as_count(size_t default_val = 0) const {
        if (!is_set) return default_val;
        return static_cast<size_t>(as_uint64());
    }

    uint64_t as_uint64(uint64_t default_val = 0) const {
        if (!is_set) return default_val;
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument("Expected a non-negative integer, got '" + value + "'");
        }
        return parse<uint64_t>(value, "a non-negative integer", [](const std::string& s, size_t* used) {
            return static_cast<uint64_t>(std::stoull(s, used));
        });
    }

    double as_double(double default_val = 0.0) const {
        if (!is_set) return default_val;
        return parse_number(value);
    }

    std::vector<std::string> as_list(char delim = ',') const {
        std::vector<std::string> items;
        if (!is_set) return items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, delim)) {
            if (!item.empty()) items.push_back(item);
        }
        return items;
    }

    std::vector<double> as_double_list(char delim = ',') const {
        std::vector<double> numbers;
        for (const auto& item : as_list(delim)) {
            numbers.push_back(parse_number(item));
        }
        return numbers;
    }

private:
    template <typename T, typename Convert>
    static T parse(const std::string& text, const char* expected, Convert convert) {
        size_t used = 0;
        T parsed{};
        try {
            parsed = convert(text, &used);
        } catch (const std::invalid_argument&) {
            used = 0;
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Value out of range: '" + text + "'");
        }
        if (used == 0 || used != text.size()) {
            throw std::invalid_argument(std::string("Expected ") + expected + ", got '" + text + "'");
        }
        return parsed;
    }

    static double parse_number(const std::string& text) {
        return parse<double>(text, "a number", [](const std::string& s, size_t* used) {
            return std::stod(s, used);
        });
    }
};

// Options of one command invocation, keyed by long name
class Args {
public:
    std::map<std::string, ArgValue> named;

    ArgValue get(const std::string& name, const std::string& default_val = "") const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{default_val, !default_val.empty()};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    const std::string& require(const std::string& name) const {
        auto it = named.find(name);
        if (it == named.end() || !it->second.is_set) {
            throw std::runtime_error("Missing required argument: --" + name);
        }
        return it->second.value;
    }
};

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;  // Presence means true, takes no value
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) std::cout << " --" << arg.name << " <value>";
        }
        std::cout << " [options]\n\n" << description << "\n";

        print_section("Required", true);
        print_section("Options", false);
        std::cout << "\n";
    }

private:
    void print_section(const std::string& title, bool required) const {
        bool any = false;
        for (const auto& arg : args) {
            if (arg.required != required) continue;
            if (!any) {
                std::cout << "\n" << title << ":\n";
                any = true;
            }

            std::string flag = "--" + arg.name;
            if (!arg.short_name.empty()) flag += ", -" + arg.short_name;
            if (!arg.is_flag) flag += " <value>";

            std::cout << "  " << std::left << std::setw(30) << flag << arg.description;
            if (!arg.default_value.empty()) {
                std::cout << " (default: " << arg.default_value << ")";
            }
            std::cout << "\n";
        }
    }
};

/**
 * @brief Subcommand dispatcher: `amod <command> [--option value | --option=value | -x value]`
 *
 * Handlers return the process exit code. Exceptions escaping a handler are
 * printed as "Error: ..." and turn into exit code 1.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string cmd_name = argv[1];

        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return 0;
        }

        if (cmd_name == "--version" || cmd_name == "-v") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }

        const Command& cmd = it->second;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.print_help(program_name_);
                return 0;
            }
        }

        Args args;
        try {
            args = parse_args(std::vector<std::string>(argv + 2, argv + argc), cmd);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            std::cerr << "Run '" << program_name_ << " " << cmd.name << " --help' for options.\n";
            return 1;
        }

        try {
            return cmd.handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - active module discovery on metabolic networks\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << std::left << std::setw(12) << name << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
        std::cout << "\nVersion: " << version_ << "\n";
    }

private:
    static Args parse_args(const std::vector<std::string>& tokens, const Command& cmd) {
        std::map<std::string, const ArgDef*> lookup;
        for (const auto& def : cmd.args) {
            lookup["--" + def.name] = &def;
            if (!def.short_name.empty()) lookup["-" + def.short_name] = &def;
        }

        Args result;
        std::set<std::string> seen;

        for (size_t i = 0; i < tokens.size(); ++i) {
            std::string token = tokens[i];
            std::string inline_value;
            bool has_inline_value = false;

            if (token.rfind("--", 0) == 0) {
                auto eq_pos = token.find('=');
                if (eq_pos != std::string::npos) {
                    inline_value = token.substr(eq_pos + 1);
                    token = token.substr(0, eq_pos);
                    has_inline_value = true;
                }
            } else if (token.size() != 2 || token[0] != '-') {
                throw std::runtime_error("Unexpected argument: " + token);
            }

            auto it = lookup.find(token);
            if (it == lookup.end()) {
                throw std::runtime_error("Unknown argument: " + token);
            }
            const ArgDef& def = *it->second;

            if (!seen.insert(def.name).second) {
                throw std::runtime_error("Argument --" + def.name + " given more than once");
            }

            if (def.is_flag) {
                if (has_inline_value) {
                    throw std::runtime_error("Flag --" + def.name + " takes no value");
                }
                result.named[def.name] = ArgValue{"true", true};
            } else if (has_inline_value) {
                result.named[def.name] = ArgValue{inline_value, true};
            } else {
                if (i + 1 >= tokens.size()) {
                    throw std::runtime_error("Argument " + token + " requires a value");
                }
                result.named[def.name] = ArgValue{tokens[++i], true};
            }
        }

        for (const auto& def : cmd.args) {
            if (seen.count(def.name)) continue;
            if (def.required) {
                throw std::runtime_error("Missing required argument: --" + def.name);
            }
            if (!def.default_value.empty()) {
                result.named[def.name] = ArgValue{def.default_value, true};
            }
        }

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace amod
