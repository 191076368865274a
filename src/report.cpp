#include "base.hpp"

#include <cstdio>
#include <cstdlib>

void impl_Panic(const std::string& msg) {
    fprintf(stderr, "panic: %s\n\n", msg.c_str());
    exit(1);
}

void impl_Fatal(const std::string& msg) {
    fprintf(stderr, "fatal: %s\n\n", msg.c_str());

    throw FatalError{};
}
