#include "cli/cli.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace slg {

namespace {

int parse_int(const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError("Expected an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigurationError("Expected an integer, got '" + value + "'");
    }
    return parsed;
}

std::string join_choices(const std::vector<std::string>& choices) {
    std::string joined;
    for (size_t i = 0; i < choices.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += choices[i];
    }
    return joined;
}

void check_choice(const ArgDef& def, const std::string& value) {
    if (def.choices.empty()) return;
    for (const auto& choice : def.choices) {
        if (choice == value) return;
    }
    throw ConfigurationError("Invalid value for --" + def.name + ": '" + value +
                             "' (expected one of: " + join_choices(def.choices) + ")");
}

}  // namespace

// ==========================================
// ArgValue / Args
// ==========================================

int ArgValue::as_int(int default_val) const {
    if (!is_set) return default_val;
    return parse_int(value);
}

std::optional<int> ArgValue::as_optional_int() const {
    if (!is_set) return std::nullopt;
    return parse_int(value);
}

ArgValue Args::get(const std::string& name) const {
    auto it = named.find(name);
    return it != named.end() ? it->second : ArgValue{};
}

std::string Args::require(const std::string& name) const {
    ArgValue arg = get(name);
    if (!arg.is_set) {
        throw ConfigurationError("Missing required argument: --" + name);
    }
    return arg.value;
}

// ==========================================
// Command
// ==========================================

std::string Command::usage(const std::string& program) const {
    std::ostringstream out;
    out << "\nUsage: " << program << " " << name;
    for (const auto& arg : args) {
        if (arg.required) {
            out << " --" << arg.name << " <value>";
        }
    }
    out << " [options]\n\n";
    out << description << "\n\n";
    out << "Options:\n";
    for (const auto& arg : args) {
        out << "  --" << arg.name;
        if (!arg.short_name.empty()) {
            out << ", -" << arg.short_name;
        }
        if (!arg.is_flag) {
            out << " <value>";
        }
        out << "\n      " << arg.description;
        if (!arg.choices.empty()) {
            out << " [" << join_choices(arg.choices) << "]";
        }
        if (!arg.default_value.empty()) {
            out << " (default: " << arg.default_value << ")";
        }
        if (arg.required) {
            out << " [required]";
        }
        out << "\n";
    }
    out << "\n";
    return out.str();
}

// ==========================================
// CLI
// ==========================================

CLI::CLI(const std::string& program_name, const std::string& version)
    : program_name_(program_name), version_(version) {}

void CLI::register_command(Command cmd) {
    std::string name = cmd.name;
    commands_[name] = std::move(cmd);
}

std::string CLI::usage() const {
    std::ostringstream out;
    out << program_name_ << " - Substitutable grammar learner\n\n";
    out << "Usage: " << program_name_ << " <command> [options]\n\n";
    out << "Commands:\n";
    for (const auto& [name, cmd] : commands_) {
        out << "  " << name;
        for (size_t i = name.length(); i < 16; ++i) out << " ";
        out << cmd.description << "\n";
    }
    out << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
    out << "\nVersion: " << version_ << "\n";
    return out.str();
}

Args CLI::parse_args(const std::vector<std::string>& words, const Command& cmd) {
    std::map<std::string, const ArgDef*> by_name;
    std::map<std::string, const ArgDef*> by_short;
    for (const auto& arg : cmd.args) {
        by_name["--" + arg.name] = &arg;
        if (!arg.short_name.empty()) {
            by_short["-" + arg.short_name] = &arg;
        }
    }

    Args result;
    for (size_t i = 0; i < words.size(); ++i) {
        const std::string& word = words[i];

        if (word.rfind("-", 0) != 0 || word == "-") {
            throw ConfigurationError("Unexpected argument: " + word);
        }

        const ArgDef* def = nullptr;
        std::optional<std::string> inline_value;
        if (word.rfind("--", 0) == 0) {
            auto eq_pos = word.find('=');
            auto it = by_name.find(word.substr(0, eq_pos));
            if (it != by_name.end()) def = it->second;
            if (eq_pos != std::string::npos) inline_value = word.substr(eq_pos + 1);
        } else if (word.length() == 2) {
            auto it = by_short.find(word);
            if (it != by_short.end()) def = it->second;
        }

        if (!def) {
            throw ConfigurationError("Unknown argument: " + word);
        }

        if (def->is_flag) {
            if (inline_value) {
                throw ConfigurationError("Flag --" + def->name + " takes no value");
            }
            result.named[def->name] = ArgValue{"true", true};
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < words.size()) {
            value = words[++i];
        } else {
            throw ConfigurationError("Argument " + word + " requires a value");
        }
        check_choice(*def, value);
        result.named[def->name] = ArgValue{value, true};
    }

    for (const auto& arg : cmd.args) {
        if (result.named.count(arg.name) > 0) continue;
        if (arg.required) {
            throw ConfigurationError("Missing required argument: --" + arg.name);
        }
        if (!arg.default_value.empty()) {
            result.named[arg.name] = ArgValue{arg.default_value, true};
        }
    }

    return result;
}

int CLI::run(int argc, char** argv) const {
    return run(std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc));
}

int CLI::run(const std::vector<std::string>& words) const {
    if (words.empty()) {
        std::cerr << usage();
        return 1;
    }
    if (words[0] == "--help" || words[0] == "-h") {
        std::cout << usage();
        return 0;
    }
    if (words[0] == "--version") {
        std::cout << program_name_ << " " << version_ << "\n";
        return 0;
    }

    auto it = commands_.find(words[0]);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << words[0] << "\n";
        std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
        return 1;
    }
    const Command& cmd = it->second;

    std::vector<std::string> options(words.begin() + 1, words.end());
    if (std::find(options.begin(), options.end(), "--help") != options.end() ||
        std::find(options.begin(), options.end(), "-h") != options.end()) {
        std::cout << cmd.usage(program_name_);
        return 0;
    }

    try {
        Args args = parse_args(options, cmd);
        return cmd.handler(args);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Run '" << program_name_ << " " << cmd.name << " --help' for options.\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace slg
