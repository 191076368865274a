#ifndef PLATFORM_H_INC
#define PLATFORM_H_INC

#if defined(_WIN32) || defined(_WIN64)
    #define OS_WINDOWS 1
#elif defined(__APPLE__) && defined(__MACH__)
    #define OS_DARWIN 1
#endif

#ifndef OS_WINDOWS
    #define OS_WINDOWS 0
#endif

#ifndef OS_DARWIN
    #define OS_DARWIN 0
#endif

#endif
