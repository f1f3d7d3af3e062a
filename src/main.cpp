#include "cli/commands.hpp"

int main(int argc, char** argv) {
    slg::CLI cli("slg", "1.0.0");
    slg::register_commands(cli);
    return cli.run(argc, argv);
}
