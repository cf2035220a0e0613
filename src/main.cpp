#include "cli/cli.hpp"

int main(int argc, char *argv[])
{
    return jigsaw::cli::run(argc, argv);
}
