#pragma once

#ifdef _WIN32
// Suppress C4251 warnings for STL containers in exported classes
#pragma warning(push)
#pragma warning(disable: 4251)
#endif

#ifdef LECTERN_SERVER_STATIC
    // For static library linking, no import/export needed
    #define LECTERN_SERVER_API
#elif defined(_WIN32)
    #ifdef LECTERN_SERVER_BUILD
        #define LECTERN_SERVER_API __declspec(dllexport)
    #else
        #define LECTERN_SERVER_API __declspec(dllimport)
    #endif
#else
    #ifdef LECTERN_SERVER_BUILD
        #define LECTERN_SERVER_API __attribute__((visibility("default")))
    #else
        #define LECTERN_SERVER_API
    #endif
#endif

#ifdef _WIN32
#pragma warning(pop)
#endif
