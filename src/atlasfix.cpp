#include "commands/commands.h"

int main(int argc, char** argv) {
    return run_atlasfix(argc, argv);
}
