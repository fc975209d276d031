#pragma once

#if defined(_MSC_VER)
    #define CHOPSTICKS_API_IMPORT __declspec(dllimport)
    #define CHOPSTICKS_API_EXPORT __declspec(dllexport)
    #define CHOPSTICKS_SUPPRESS_EXPORT_WARNING __pragma(warning(push)) __pragma(warning(disable: 4251 4275))
    #define CHOPSTICKS_RESTORE_EXPORT_WARNING __pragma(warning(pop))
#elif defined(__GNUC__)
    #define CHOPSTICKS_API_IMPORT
    #define CHOPSTICKS_API_EXPORT __attribute__((visibility("default")))
    #define CHOPSTICKS_SUPPRESS_EXPORT_WARNING
    #define CHOPSTICKS_RESTORE_EXPORT_WARNING
#else
    #define CHOPSTICKS_API_IMPORT
    #define CHOPSTICKS_API_EXPORT
    #define CHOPSTICKS_SUPPRESS_EXPORT_WARNING
    #define CHOPSTICKS_RESTORE_EXPORT_WARNING
#endif

#if defined(CHOPSTICKS_BUILD_SHARED)
    #ifdef CHOPSTICKS_EXPORT_SHARED
        #define CHOPSTICKS_API CHOPSTICKS_API_EXPORT
    #else
        #define CHOPSTICKS_API CHOPSTICKS_API_IMPORT
    #endif
#else
    #define CHOPSTICKS_API
#endif
