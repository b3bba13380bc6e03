#ifndef PATHSAFE_EXPORT_HPP
#define PATHSAFE_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Symbol visibility macros for the pathsafe library.
 *
 * When building pathsafe as a shared library:
 * - Define PATHSAFE_SHARED when consuming the library
 * - PATHSAFE_BUILDING_SHARED is defined by the build while compiling it
 *
 * Usage in headers:
 *   PATHSAFE_API bool is_valid_filename(const std::string& name);
 *   class PATHSAFE_API FileNameValidator { ... };
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PATHSAFE_BUILDING_SHARED
        #define PATHSAFE_API __declspec(dllexport)
    #elif defined(PATHSAFE_SHARED)
        #define PATHSAFE_API __declspec(dllimport)
    #else
        #define PATHSAFE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef PATHSAFE_BUILDING_SHARED
        #define PATHSAFE_API __attribute__((visibility("default")))
    #else
        #define PATHSAFE_API
    #endif
#else
    #define PATHSAFE_API
#endif

#endif // PATHSAFE_EXPORT_HPP
