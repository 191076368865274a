#include <gtest/gtest.h>

#include "driver.hpp"

using Args = std::vector<std::string>;

static DispatchConfig shellConfig() {
    DispatchConfig cfg;
    cfg.linker_name = "sh";
    return cfg;
}

TEST(DispatchTest, DefaultConfig) {
    DispatchConfig cfg;

    EXPECT_EQ(cfg.linker_name, LDSHIM_LINKER);
    EXPECT_EQ(cfg.policy, &GetDefaultExportPolicy());
}

TEST(DispatchTest, CollectLinkerArgsDropsProgramName) {
    char prog[] = "ldshim";
    char out_flag[] = "-o";
    char out_file[] = "out.wasm";
    char* argv[] = { prog, out_flag, out_file, nullptr };

    EXPECT_EQ(CollectLinkerArgs(3, argv), (Args{ "-o", "out.wasm" }));
    EXPECT_EQ(CollectLinkerArgs(1, argv), Args{});
    EXPECT_EQ(CollectLinkerArgs(0, argv), Args{});
}

TEST(DispatchTest, PropagatesExitCode) {
    auto cfg = shellConfig();

    EXPECT_EQ(Dispatch(cfg, Args{ "-c", "exit 0" }), 0);
    EXPECT_EQ(Dispatch(cfg, Args{ "-c", "exit 1" }), 1);
    EXPECT_EQ(Dispatch(cfg, Args{ "-c", "exit 2" }), 2);
}

TEST(DispatchTest, LinkerReceivesFilteredArgs) {
    auto cfg = shellConfig();

    Args args {
        "-c", "[ \"$*\" = '-o out.wasm --export ICU4XDataProvider_create_compiled --export malloc input.o' ]", "sh",
        "-o", "out.wasm",
        "--export", "ICU4XDataProvider_create_compiled",
        "--export", "ICU4XFoo_bar",
        "--export", "malloc",
        "input.o"
    };

    EXPECT_EQ(Dispatch(cfg, args), 0);
}

TEST(DispatchTest, DanglingExportNeverReachesLinker) {
    auto cfg = shellConfig();

    Args args { "-c", "exit $#", "sh", "a.o", "--export" };

    EXPECT_EQ(Dispatch(cfg, args), 1);
}

TEST(DispatchTest, UsesConfiguredPolicy) {
    ExportPolicy policy;
    policy.prefix = "lib_";

    auto cfg = shellConfig();
    cfg.policy = &policy;

    Args args { "-c", "[ \"$*\" = '--export ICU4XFoo_bar' ]", "sh", "--export", "lib_private", "--export", "ICU4XFoo_bar" };

    EXPECT_EQ(Dispatch(cfg, args), 0);
}

TEST(DispatchTest, LaunchFailure) {
    DispatchConfig cfg;
    cfg.linker_name = "ldshim-test-no-such-linker";

    testing::internal::CaptureStderr();
    int exit_code = Dispatch(cfg, Args{ "--export", "malloc" });
    testing::internal::GetCapturedStderr();

    EXPECT_EQ(exit_code, EXITCODE_LAUNCH_FAILURE);
}
