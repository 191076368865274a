#include "driver.hpp"

#include "linker.hpp"

std::vector<std::string> CollectLinkerArgs(int argc, char* argv[]) {
    std::vector<std::string> args;
    if (argc > 1) {
        args.assign(argv + 1, argv + argc);
    }

    return args;
}

int Dispatch(const DispatchConfig& cfg, llvm::ArrayRef<std::string> args) {
    LinkConfig lconfig { cfg.linker_name, FilterExportArgs(*cfg.policy, args) };

    try {
        return RunLinker(lconfig);
    } catch (FatalError&) {
        return EXITCODE_LAUNCH_FAILURE;
    }
}
