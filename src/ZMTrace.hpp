//
//  ZMTrace.hpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

// Usage:
//   #define ZMTRACE  // This should be first
//   #include "ZMTrace.hpp"
// Without ZMTRACE defined, the trace macros compile to nothing.
// No include guard: a file may #undef ZMTRACE and include this again.

#undef tracePrintf
#undef tracePrintf1
#undef tracePrintf2
#undef tracePrintf3
#undef tracePrintf4

#ifdef ZMTRACE

#include "ZMErrorReporter.hpp"

#define tracePrintf(fmt)                    ZMErrorReporter::logInfo(__FUNCTION__, fmt)
#define tracePrintf1(fmt, a1)               ZMErrorReporter::logInfo(__FUNCTION__, fmt, a1)
#define tracePrintf2(fmt, a1, a2)           ZMErrorReporter::logInfo(__FUNCTION__, fmt, a1, a2)
#define tracePrintf3(fmt, a1, a2, a3)       ZMErrorReporter::logInfo(__FUNCTION__, fmt, a1, a2, a3)
#define tracePrintf4(fmt, a1, a2, a3, a4)   ZMErrorReporter::logInfo(__FUNCTION__, fmt, a1, a2, a3, a4)

#else

#define tracePrintf(fmt)
#define tracePrintf1(fmt, a1)
#define tracePrintf2(fmt, a1, a2)
#define tracePrintf3(fmt, a1, a2, a3)
#define tracePrintf4(fmt, a1, a2, a3, a4)

#endif  // ZMTRACE
