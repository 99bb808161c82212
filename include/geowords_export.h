#ifndef GEOWORDS_EXPORT_H
#define GEOWORDS_EXPORT_H

// Define export macros for different platforms
#if defined(_WIN32) || defined(_WIN64)
    #ifdef GEOWORDS_BUILDING_SHARED_LIBRARY
        #define GEOWORDS_API __declspec(dllexport)
    #else
        #define GEOWORDS_API __declspec(dllimport)
    #endif
#else
    #ifdef GEOWORDS_BUILDING_SHARED_LIBRARY
        #define GEOWORDS_API __attribute__((visibility("default")))
    #else
        #define GEOWORDS_API
    #endif
#endif

#endif // GEOWORDS_EXPORT_H
