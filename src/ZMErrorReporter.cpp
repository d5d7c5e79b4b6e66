//
//  ZMErrorReporter.cpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#include "ZMErrorReporter.hpp"
#include "ZMLock.hpp"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

// Keeps lines from different threads from interleaving
static ZMLock outputLock;

static void
logLine(const char *severity,
        const char *who,
        const char *fmt,
        va_list    args) {
    char buf[1024];
    int len = vsnprintf(buf, sizeof(buf), fmt, args);
    ZMLockHolder holder(&outputLock);
    fprintf(stderr, "%s %s: %s%s\n", severity, who ? who : "?", buf,
            len >= (int)sizeof(buf) ? "...[truncated]" : "");
    fflush(stderr);
}

/*static*/ void
ZMErrorReporter::logInfo(const char *who,
                         const char *fmt,
                         ...) {
    va_list args;
    va_start(args, fmt);
    logLine("INFO", who, fmt, args);
    va_end(args);
}

/*static*/ void
ZMErrorReporter::logError(const char *who,
                          const char *fmt,
                          ...) {
    va_list args;
    va_start(args, fmt);
    logLine("ERROR", who, fmt, args);
    va_end(args);
}

/*static*/ void
ZMErrorReporter::logErrorWithCode(const char *who,
                                  int        errorCode,
                                  const char *fmt,
                                  ...) {
    char severity[32];
    snprintf(severity, sizeof(severity), "ERROR(%d)", errorCode);
    va_list args;
    va_start(args, fmt);
    logLine(severity, who, fmt, args);
    va_end(args);
}

/*static*/ void
ZMErrorReporter::assertionFailed(const char *expression,
                                 const char *file,
                                 int        line) {
    logError("ZMAssert", "%s:%d: assertion failed: %s", file, line, expression);
    abort();
}
