#ifndef UCTSEARCH_CORE_EXPORT_MACROS_H
#define UCTSEARCH_CORE_EXPORT_MACROS_H

// Simple export macros for shared library building
#ifdef _WIN32
    #ifdef UCTSEARCH_EXPORTS
        #define UCTSEARCH_API __declspec(dllexport)
    #else
        #define UCTSEARCH_API __declspec(dllimport)
    #endif
#else
    #define UCTSEARCH_API __attribute__((visibility("default")))
#endif

#endif // UCTSEARCH_CORE_EXPORT_MACROS_H
