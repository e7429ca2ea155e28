#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(SERIALIZABLE_STATIC)
    #define SERIALIZABLE_API
  #else
    #if defined(SERIALIZABLE_EXPORTS)
      #define SERIALIZABLE_API __declspec(dllexport)
    #else
      #define SERIALIZABLE_API __declspec(dllimport)
    #endif
  #endif
#else
  #define SERIALIZABLE_API
#endif

