#ifndef LINKER_H_INC
#define LINKER_H_INC

#include "base.hpp"

struct LinkConfig {
    // The linker program.  Names without a path separator are looked up in
    // the executable search path.
    std::string linker_name;

    // Arguments passed to the linker after argv[0].
    std::vector<std::string> args;
};

// RunLinker runs the linker to completion with the standard streams inherited
// from this process and returns its exit code.  A linker killed by signal N
// yields (256 - N) & 0xFF.  If the linker cannot be found or started, a fatal
// error is reported.
int RunLinker(const LinkConfig& cfg);

#endif
