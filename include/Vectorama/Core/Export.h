#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - VECTORAMA_BUILD_SHARED: when building Vectorama as shared library
 *   - VECTORAMA_USE_SHARED: when using Vectorama as shared library
 *   - VECTORAMA_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(VECTORAMA_BUILD_SHARED)
        #define VECTORAMA_API __declspec(dllexport)
    #elif defined(VECTORAMA_USE_SHARED)
        #define VECTORAMA_API __declspec(dllimport)
    #else
        #define VECTORAMA_API
    #endif
#else
    #if defined(VECTORAMA_BUILD_SHARED)
        #define VECTORAMA_API __attribute__((visibility("default")))
    #else
        #define VECTORAMA_API
    #endif
#endif
