#include "agentreg/cli.hpp"

int main(int argc, char *argv[])
{
    return agentreg::cli::run(argc, argv);
}
