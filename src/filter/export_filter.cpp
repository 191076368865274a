#include "exports.hpp"

static const char* default_allowed_symbols[] = {
    "ICU4XDataProvider_create_compiled",
    "ICU4XDataProvider_destroy",
    "ICU4XCodePointMapData8_load_line_break",
    "ICU4XCodePointMapData8_get32",
    "ICU4XCodePointMapData8_destroy",
};

static ExportPolicy makeDefaultPolicy() {
    ExportPolicy policy;
    policy.prefix = LDSHIM_EXPORT_PREFIX;

    for (const char* sym : default_allowed_symbols) {
        policy.allowed.insert(sym);
    }

    return policy;
}

const ExportPolicy& GetDefaultExportPolicy() {
    static const ExportPolicy default_policy = makeDefaultPolicy();
    return default_policy;
}

bool ExportPolicy::IsExportAllowed(llvm::StringRef name) const {
    return !name.startswith(prefix) || allowed.contains(name);
}

/* -------------------------------------------------------------------------- */

void ExportFilter::Feed(llvm::StringRef arg) {
    switch (state) {
    case FSTATE_IDLE:
        if (arg == EXPORT_FLAG) {
            state = FSTATE_PENDING_EXPORT;
        } else {
            out_args.emplace_back(arg.str());
        }
        break;
    case FSTATE_PENDING_EXPORT:
        if (policy.IsExportAllowed(arg)) {
            out_args.emplace_back(EXPORT_FLAG);
            out_args.emplace_back(arg.str());
        }

        state = FSTATE_IDLE;
        break;
    default:
        Panic("invalid export filter state: {0}", (int)state);
    }
}

std::vector<std::string> ExportFilter::Finish() {
    // The flag was never emitted, so there is nothing to take back.
    state = FSTATE_IDLE;

    return std::move(out_args);
}

std::vector<std::string> FilterExportArgs(const ExportPolicy& policy, llvm::ArrayRef<std::string> args) {
    ExportFilter filter(policy);

    for (const auto& arg : args) {
        filter.Feed(arg);
    }

    return filter.Finish();
}
