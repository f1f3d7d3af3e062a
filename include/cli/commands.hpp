#pragma once

#include "cli/cli.hpp"

namespace slg {

/**
 * @brief `slg learn`: learn a grammar from a file or directory and write the report
 *
 * Returns 1 when no substring survives the length policy; input and
 * configuration errors propagate to CLI::run.
 */
int cmd_learn(const Args& args);

/**
 * @brief `slg demo`: run the built-in corpora and print their reports
 */
int cmd_demo(const Args& args);

/**
 * @brief `slg config`: write a default JSON configuration file
 */
int cmd_config(const Args& args);

/**
 * @brief Register learn, demo and config with their options
 */
void register_commands(CLI& cli);

} // namespace slg
