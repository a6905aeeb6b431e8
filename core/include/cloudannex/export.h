#pragma once

#ifdef _WIN32
    #ifdef CLOUDANNEX_EXPORTS
        #define CA_API __declspec(dllexport)
    #else
        #define CA_API __declspec(dllimport)
    #endif
#else
    #define CA_API __attribute__((visibility("default")))
#endif
