//
//  ZMCalendar.cpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

// Proleptic Gregorian calendar <=> Julian Day Number, and the day-level helpers.
// The Ethiopian side lives in ZMCalendar_ethiopian.cpp.

#include "ZMCalendar.hpp"
#include "ZMCalendarPvt.hpp"
#include "ZMErrorReporter.hpp"
#include "ZMUserPrefs.hpp"
#include "ZMUtil.hpp"

#include <math.h>
#include <time.h>

const char *
ZMCalendar_statusDescription(ZMCalendarStatus status) {
    switch(status) {
      case ZMCalendarStatusOK:          return "OK";
      case ZMCalendarStatusInvalidDate: return "Invalid date for calendar";
      case ZMCalendarStatusInvalidJDN:  return "Invalid Julian Day Number";
    }
    return "Unknown status";
}

void
ZMCalendar_noteInvalidDate(const char *who,
                           int        year,
                           int        month,
                           int        day) {
    if (ZMUserPrefs::boolPref(ZMCalendarLogFailuresPref)) {
        ZMErrorReporter::logErrorWithCode(who, ZMCalendarStatusInvalidDate, "%s: %04d/%02d/%02d",
                                          ZMCalendar_statusDescription(ZMCalendarStatusInvalidDate), year, month, day);
    }
}

void
ZMCalendar_noteInvalidJDN(const char        *who,
                          ZMJulianDayNumber jdn) {
    if (ZMUserPrefs::boolPref(ZMCalendarLogFailuresPref)) {
        ZMErrorReporter::logErrorWithCode(who, ZMCalendarStatusInvalidJDN, "%s: %ld",
                                          ZMCalendar_statusDescription(ZMCalendarStatusInvalidJDN), jdn);
    }
}

bool
ZMCalendar_isGregorianLeapYear(int year) {
    return (ZMUtil::floorMod(year, 4) == 0 && ZMUtil::floorMod(year, 100) != 0) ||
        ZMUtil::floorMod(year, 400) == 0;
}

int
ZMCalendar_daysInGregorianMonth(int year,
                                int month) {
    switch(month - 1) {
      case  0: return 31;	// Jan
      case  1: return ZMCalendar_isGregorianLeapYear(year) ? 29 : 28;
      case  2: return 31;	// Mar
      case  3: return 30;	// Apr
      case  4: return 31;	// May
      case  5: return 30;	// Jun
      case  6: return 31;	// Jul
      case  7: return 31;	// Aug
      case  8: return 30;	// Sep
      case  9: return 31;	// Oct
      case 10: return 30;	// Nov
      case 11: return 31;	// Dec
    }
    return 0;
}

// The result equals the proleptic ordinal day (0001-01-01 == 1) plus kZMGregorianOrdinalOffset.
ZMCalendarStatus
ZMCalendar_gregorianToJDN(int               year,
                          int               month,
                          int               day,
                          ZMJulianDayNumber *jdn) {
    ZMAssert(jdn);
    if (year < kZMMinimumGregorianYear ||
        year > kZMMaximumGregorianYear ||
        day < 1 ||
        day > ZMCalendar_daysInGregorianMonth(year, month)) {  // 0 for a bad month
        ZMCalendar_noteInvalidDate("ZMCalendar_gregorianToJDN", year, month, day);
        return ZMCalendarStatusInvalidDate;
    }
    // Count months from March so the leap day is the last day of the counted year
    long signedYear = year;
    long monthI;
    if (month < 3) {
        monthI = month + 12;
        signedYear--;
    } else {
        monthI = month;
    }
    long c = ZMUtil::floorDiv(signedYear, 100);
    long x = signedYear - 100 * c;
    *jdn = kZMJDNBeforeMarchYear0
        + ZMUtil::floorDiv(kZMDaysInGregorianCycle * c, 4)
        + ZMUtil::floorDiv(kZMDaysInNonLeapCentury * x, 100)
        + ZMUtil::floorDiv(153 * monthI - 457, 5)
        + day;
    return ZMCalendarStatusOK;
}

ZMCalendarStatus
ZMCalendar_jdnToGregorian(ZMJulianDayNumber jdn,
                          ZMDateComponents  *gregorianDate) {
    ZMAssert(gregorianDate);
    // kZMGregorianOrdinalOffset itself is ordinal day 0, which is not a date
    if (jdn <= kZMGregorianOrdinalOffset ||
        jdn > kZMMaximumGregorianJDN) {
        ZMCalendar_noteInvalidJDN("ZMCalendar_jdnToGregorian", jdn);
        return ZMCalendarStatusInvalidJDN;
    }
    long x2 = jdn - (kZMJDNBeforeMarchYear0 + 1);  // days since 0000-03-01

    long century = ZMUtil::floorDiv(4 * x2 + 3, kZMDaysInGregorianCycle);
    long x1 = x2 - ZMUtil::floorDiv(kZMDaysInGregorianCycle * century, 4);
    long yearWithinCentury = ZMUtil::floorDiv(100 * x1 + 99, kZMDaysInNonLeapCentury);
    long signedYear = (100 * century) + yearWithinCentury;
    long x0 = x1 - ZMUtil::floorDiv(kZMDaysInNonLeapCentury * yearWithinCentury, 100);
    long monthI = ZMUtil::floorDiv(5 * x0 + 461, 153);
    int month;
    if (monthI > 12) {
        month = (int)(monthI - 12);
        signedYear++;
    } else {
        month = (int)monthI;
    }
    gregorianDate->year = (int)signedYear;
    gregorianDate->month = month;
    gregorianDate->day = (int)(x0 - ZMUtil::floorDiv(153 * monthI - 457, 5) + 1);
    return ZMCalendarStatusOK;
}

ZMCalendarStatus
ZMCalendar_gregorianToEthiopian(int              year,
                                int              month,
                                int              day,
                                ZMDateComponents *ethiopianDate) {
    ZMJulianDayNumber jdn;
    ZMCalendarStatus status = ZMCalendar_gregorianToJDN(year, month, day, &jdn);
    if (status != ZMCalendarStatusOK) {
        return status;
    }
    return ZMCalendar_jdnToEthiopian(jdn, ethiopianDate);
}

// (0 == Sunday); JDN 0 was a Monday
int
ZMCalendar_weekdayFromJDN(ZMJulianDayNumber jdn) {
    return (int)ZMUtil::floorMod(jdn + 1, 7);
}

ZMCalendarStatus
ZMCalendar_jdnFromUnixTime(double            unixTime,
                           double            tzOffsetSeconds,
                           ZMJulianDayNumber *jdn) {
    ZMAssert(jdn);
    double localDays = floor((unixTime + tzOffsetSeconds) / kZMSecondsInDay);
    // Range-check as a double so the cast below is always defined (NaN fails both tests)
    if (!(localDays >= (double)(kZMMinimumSupportedJDN - kZMUnixEpochJDN) &&
          localDays <= (double)(kZMMaximumEthiopianJDN - kZMUnixEpochJDN))) {
        if (ZMUserPrefs::boolPref(ZMCalendarLogFailuresPref)) {
            ZMErrorReporter::logErrorWithCode("ZMCalendar_jdnFromUnixTime", ZMCalendarStatusInvalidJDN, "%s: %g%+g",
                                              ZMCalendar_statusDescription(ZMCalendarStatusInvalidJDN), unixTime, tzOffsetSeconds);
        }
        return ZMCalendarStatusInvalidJDN;
    }
    *jdn = kZMUnixEpochJDN + (ZMJulianDayNumber)localDays;
    return ZMCalendarStatusOK;
}

ZMCalendarStatus
ZMCalendar_currentJDN(double            tzOffsetSeconds,
                      ZMJulianDayNumber *jdn) {
    struct timespec ts;
    if (clock_gettime(CLOCK_REALTIME, &ts) != 0) {
        ZMErrorReporter::logError("ZMCalendar_currentJDN", "clock_gettime failed; using time()");
        return ZMCalendar_jdnFromUnixTime((double)time(NULL), tzOffsetSeconds, jdn);
    }
    double t = ts.tv_sec + ts.tv_nsec / 1E9;
    return ZMCalendar_jdnFromUnixTime(t, tzOffsetSeconds, jdn);
}
