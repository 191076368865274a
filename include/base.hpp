#ifndef BASE_H_INC
#define BASE_H_INC

#include <string>
#include <stdexcept>
#include <utility>
#include <vector>

#include "llvm/Support/FormatVariadic.h"

#include "platform.hpp"

/* -------------------------------------------------------------------------- */

[[ noreturn ]] void impl_Panic(const std::string& msg);
[[ noreturn ]] void impl_Fatal(const std::string& msg);

// Panic prints a fatal error and exits the process.  This is only meant to be
// used for unreachable states in the shim (asserts, etc.).
template<typename... Args>
[[ noreturn ]]
inline void Panic(const char* fmt, Args&&... args) {
    impl_Panic(llvm::formatv(fmt, std::forward<Args>(args)...).str());
}

// ReportFatal reports an error that stops the shim before the linker runs.
template<typename... Args>
[[ noreturn ]]
inline void ReportFatal(const char* fmt, Args&&... args) {
    impl_Fatal(llvm::formatv(fmt, std::forward<Args>(args)...).str());
}

/* -------------------------------------------------------------------------- */

// FatalError is just a signal used to exit out of the dispatch.  The thrower
// should report all appropriate information before throwing.
struct FatalError : public std::exception {
};

#endif
