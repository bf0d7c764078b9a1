#include "cli.hpp"

int main(int argc, char* argv[]) {
    return termineer::run_cli(argc, argv);
}
