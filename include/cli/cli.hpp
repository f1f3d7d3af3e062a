#pragma once

#include "common/errors.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace slg {

// ============================================================================
// Parsed Values
// ============================================================================

/**
 * @brief One option value as given on the command line
 */
struct ArgValue {
    std::string value;
    bool is_set = false;

    /**
     * @brief Integer value, or default_val when unset
     * @throws ConfigurationError if the value is not an integer
     */
    int as_int(int default_val = 0) const;

    /**
     * @brief Integer value, or nullopt when unset
     * @throws ConfigurationError if the value is not an integer
     */
    std::optional<int> as_optional_int() const;
};

/**
 * @brief Options of one command invocation, defaults already applied
 */
class Args {
public:
    std::map<std::string, ArgValue> named;

    // Unset value for options that were neither given nor defaulted
    ArgValue get(const std::string& name) const;

    bool has(const std::string& name) const { return get(name).is_set; }

    /**
     * @throws ConfigurationError if the option was not given
     */
    std::string require(const std::string& name) const;
};

// ============================================================================
// Command Definitions
// ============================================================================

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;                 // Presence means "true"; takes no value
    std::vector<std::string> choices;     // Allowed values; empty = any
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    /**
     * @brief Option listing shown by `<program> <command> --help`
     */
    std::string usage(const std::string& program) const;
};

// ============================================================================
// Command Registry
// ============================================================================

/**
 * @brief Subcommand dispatcher
 *
 * Options are `--name value`, `--name=value` or `-x value`; flags take no
 * value. Commands take no positional words.
 * Exit codes: 0 for help and version, 1 for usage errors and for exceptions
 * escaping a handler, otherwise whatever the handler returns.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version);

    void register_command(Command cmd);

    int run(int argc, char** argv) const;

    /**
     * @brief Dispatch the words that follow the program name
     */
    int run(const std::vector<std::string>& words) const;

    /**
     * @brief Top-level help with every registered command
     */
    std::string usage() const;

    /**
     * @brief Parse the words after the command name
     * @throws ConfigurationError for unknown options, stray words, missing
     *         values, missing required options and values outside `choices`
     */
    static Args parse_args(const std::vector<std::string>& words, const Command& cmd);

private:
    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace slg
