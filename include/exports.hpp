#ifndef EXPORTS_H_INC
#define EXPORTS_H_INC

#include "base.hpp"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"

#ifndef LDSHIM_EXPORT_PREFIX
    #define LDSHIM_EXPORT_PREFIX "ICU4X"
#endif

// The linker flag whose argument is subject to filtering.
#define EXPORT_FLAG "--export"

// ExportPolicy decides which exported symbols are allowed through to the
// linker.  Only symbols starting with prefix are filtered: those must also be
// listed in allowed to keep their export.
struct ExportPolicy {
    std::string prefix;
    llvm::StringSet<> allowed;

    // IsExportAllowed returns whether an `--export name` pair should be kept.
    bool IsExportAllowed(llvm::StringRef name) const;
};

// GetDefaultExportPolicy returns the policy compiled into the shim.  It is
// built on first use and never modified afterwards.
const ExportPolicy& GetDefaultExportPolicy();

/* -------------------------------------------------------------------------- */

enum FilterState {
    FSTATE_IDLE,
    FSTATE_PENDING_EXPORT,

    FSTATES_COUNT
};

// ExportFilter rewrites a linker command line one token at a time.  A token
// following `--export` decides whether the pair survives: `--export` itself is
// only ever emitted together with its argument.
class ExportFilter {
    const ExportPolicy& policy;

    FilterState state { FSTATE_IDLE };
    std::vector<std::string> out_args;

public:
    ExportFilter(const ExportPolicy& policy)
    : policy(policy)
    {}

    // Feed consumes the next token of the command line.
    void Feed(llvm::StringRef arg);

    // Finish returns the filtered command line.  A dangling `--export` at the
    // end of the input is dropped.
    std::vector<std::string> Finish();

    FilterState GetState() const { return state; }
};

// FilterExportArgs runs args through an ExportFilter using policy.
std::vector<std::string> FilterExportArgs(const ExportPolicy& policy, llvm::ArrayRef<std::string> args);

#endif
