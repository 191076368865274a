#ifndef DRIVER_H_INC
#define DRIVER_H_INC

#include "exports.hpp"

#include "llvm/ADT/ArrayRef.h"

#ifndef LDSHIM_LINKER
    #define LDSHIM_LINKER "ld.lld"
#endif

// Returned when the linker could not be launched at all.  This follows the
// shell's "command not found" convention for the host.
#if OS_WINDOWS
    #define EXITCODE_LAUNCH_FAILURE 9009
#else
    #define EXITCODE_LAUNCH_FAILURE 127
#endif

struct DispatchConfig {
    std::string linker_name;
    const ExportPolicy* policy;

    DispatchConfig()
    : linker_name(LDSHIM_LINKER)
    , policy(&GetDefaultExportPolicy())
    {}
};

// CollectLinkerArgs returns the command line minus the program name.
std::vector<std::string> CollectLinkerArgs(int argc, char* argv[]);

// Dispatch filters the export directives in args and runs the linker on the
// result.  It returns the linker's exit code or EXITCODE_LAUNCH_FAILURE.
int Dispatch(const DispatchConfig& cfg, llvm::ArrayRef<std::string> args);

#endif
