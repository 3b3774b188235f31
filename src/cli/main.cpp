#include "cli.hpp"

int main(int argc, char** argv) {
    return guid::cli::run(argc, argv);
}
