#include "gpgalias/cli.hpp"

int main(int argc, char *argv[])
{
    return gpgalias::cli::run(argc, argv);
}
