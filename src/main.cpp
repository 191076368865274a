#include "driver.hpp"

// The shim takes no options of its own: every argument belongs to the linker.
int main(int argc, char* argv[]) {
    DispatchConfig cfg;
    return Dispatch(cfg, CollectLinkerArgs(argc, argv));
}
