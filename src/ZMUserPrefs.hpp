//
//  ZMUserPrefs.hpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#ifndef _ZMUSERPREFS_HPP_
#define _ZMUSERPREFS_HPP_

#include <string>

// Log each rejected conversion input through ZMErrorReporter
#define ZMCalendarLogFailuresPref "ZMCalendarLogFailures"

/*! Process-wide preference store.  A preference set in-process wins;
 *  otherwise the environment variable of the same name is consulted.
 *  All methods may be called from any thread. */
class ZMUserPrefs {
  public:
    static std::string      stringPref(const char *name);   // "" if unset
    static bool             boolPref(const char *name);     // false if unset or unparseable
    static bool             hasPref(const char *name);

    static void             setPref(const char        *name,
                                    const std::string &value);
    static void             setPref(const char *name,
                                    bool       value);
    static void             removePref(const char *name);  // Environment fallback applies again afterwards
};

#endif  // _ZMUSERPREFS_HPP_
