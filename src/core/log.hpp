// core/log.hpp
// Console logging macros
//
//   AFXDP_LOG(...)   - lifecycle events on stdout ("[XSK] bound ..."),
//                      compiled out with -DAFXDP_QUIET
//   AFXDP_WARN(...)  - warnings on stderr, always on
//   DEBUG_PRINT(...) - hot-path tracing, compiled in only with -DDEBUG

#pragma once

#include <cstdio>

#ifdef DEBUG
#define DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#define DEBUG_FPRINTF(...) do { fprintf(__VA_ARGS__); fflush(stderr); } while(0)
#else
#define DEBUG_PRINT(...) ((void)0)
#define DEBUG_FPRINTF(...) ((void)0)
#endif

#ifdef AFXDP_QUIET
#define AFXDP_LOG(...) ((void)0)
#else
#define AFXDP_LOG(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#endif

#define AFXDP_WARN(...) do { fprintf(stderr, __VA_ARGS__); fflush(stderr); } while(0)
