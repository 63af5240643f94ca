#pragma once

// Macro definitions for controlling DLL import/export
#ifdef _WIN32
    #ifdef LABEL_LINK_STATIC
        // Static library
        #define LABEL_LINK_API
    #elif defined(LABEL_LINK_EXPORTS)
        // Dynamic library export
        #define LABEL_LINK_API __declspec(dllexport)
    #else
        // Dynamic library import
        #define LABEL_LINK_API __declspec(dllimport)
    #endif
#else
    // Non-Windows platform
    #if defined(LABEL_LINK_EXPORTS) && defined(__GNUC__) && __GNUC__ >= 4
        #define LABEL_LINK_API __attribute__ ((visibility ("default")))
    #else
        #define LABEL_LINK_API
    #endif
#endif
