//
//  ZMErrorReporter.hpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#ifndef _ZMERRORREPORTER_HPP_
#define _ZMERRORREPORTER_HPP_

#if defined(__GNUC__)
#define ZM_PRINTF_LIKE(fmtIndex, firstArg) __attribute__((format(printf, fmtIndex, firstArg)))
#else
#define ZM_PRINTF_LIKE(fmtIndex, firstArg)
#endif

/*! Diagnostic output.  Every call writes exactly one line to stderr,
 *  prefixed with the severity and the 'who' tag.  A formatted message
 *  longer than 1023 bytes is cut there and marked "...[truncated]". */
class ZMErrorReporter {
  public:
    static void             logInfo(const char *who,
                                    const char *fmt,
                                    ...) ZM_PRINTF_LIKE(2, 3);
    static void             logError(const char *who,
                                     const char *fmt,
                                     ...) ZM_PRINTF_LIKE(2, 3);
    static void             logErrorWithCode(const char *who,
                                             int        errorCode,
                                             const char *fmt,
                                             ...) ZM_PRINTF_LIKE(3, 4);

    // Called by ZMAssert; does not return
    static void             assertionFailed(const char *expression,
                                            const char *file,
                                            int        line);
};

#ifdef NDEBUG
#define ZMAssert(expr) ((void)0)
#else
#define ZMAssert(expr) ((expr) ? (void)0 : ZMErrorReporter::assertionFailed(#expr, __FILE__, __LINE__))
#endif

#endif  // _ZMERRORREPORTER_HPP_
