#pragma once

#if defined(_WIN32)
    #if defined(DRIFTWATCH_EXPORT)
        #define DRIFTWATCH_API __declspec(dllexport)
    #else
        #define DRIFTWATCH_API __declspec(dllimport)
    #endif
#elif defined(DRIFTWATCH_STATIC)
    #define DRIFTWATCH_API
#else
    #define DRIFTWATCH_API __attribute__((visibility("default")))
#endif
