// Copyright (c) BoxMin contributors

#pragma once

#ifdef _WIN32
#ifdef _MSC_VER
#pragma warning(disable : 4251)
#endif
#ifdef BOXMIN_EXPORTS
#ifdef __GNUC__
#define BOXMIN_DLLEXPORT __attribute__((dllexport))
#else
#define BOXMIN_DLLEXPORT __declspec(dllexport)
#endif
#elif defined(BOXMIN_IMPORTS)
#ifdef __GNUC__
#define BOXMIN_DLLEXPORT __attribute__((dllimport))
#else
#define BOXMIN_DLLEXPORT __declspec(dllimport)
#endif
#else
#define BOXMIN_DLLEXPORT
#endif
#else  // _WIN32
#ifdef BOXMIN_EXPORTS
#define BOXMIN_DLLEXPORT __attribute__((visibility("default")))
#else
#define BOXMIN_DLLEXPORT
#endif
#endif  // _WIN32
