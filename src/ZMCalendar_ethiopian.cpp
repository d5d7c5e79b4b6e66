//
//  ZMCalendar_ethiopian.cpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

// Ethiopian calendar <=> Julian Day Number.  Twelve 30-day months and a
// 13th month (Pagume) of 5 days, 6 in the year before each cycle boundary.

#include "ZMCalendar.hpp"
#include "ZMCalendarPvt.hpp"
#include "ZMErrorReporter.hpp"
#include "ZMUtil.hpp"

#undef ZMTRACE
#include "ZMTrace.hpp"

bool
ZMCalendar_isEthiopianLeapYear(int year) {
    return ZMUtil::floorMod((long)year + 1, 4) == 0;
}

int
ZMCalendar_daysInEthiopianMonth(int year,
                                int month) {
    if (month < 1 || month > kZMEthiopianMonthsInYear) {
        return 0;
    }
    if (month < kZMEthiopianMonthsInYear) {
        return kZMDaysInEthiopianMonth;
    }
    return ZMCalendar_isEthiopianLeapYear(year) ? 6 : 5;
}

ZMCalendarStatus
ZMCalendar_jdnToEthiopian(ZMJulianDayNumber jdn,
                          ZMDateComponents  *ethiopianDate) {
    ZMAssert(ethiopianDate);
    if (jdn < kZMMinimumSupportedJDN ||
        jdn > kZMMaximumEthiopianJDN) {  // the year would not fit in an int
        ZMCalendar_noteInvalidJDN("ZMCalendar_jdnToEthiopian", jdn);
        return ZMCalendarStatusInvalidJDN;
    }
    // Day 1 of each month falls one day past the raw 30-day boundary, so shift
    // before decomposing.  The last day of a month then carries into the next
    // month, and the last day of Pagume into Meskerem 1 of the following year.
    long d = jdn - kZMEthiopianEpoch + 1;
    long r = ZMUtil::floorMod(d, kZMDaysInEthiopianCycle);  // day within the 4-year cycle
    long n = ZMUtil::floorMod(r, 365) + 365 * ZMUtil::floorDiv(r, kZMDaysInEthiopianCycle - 1);  // day within the year
    long year = 4 * ZMUtil::floorDiv(d, kZMDaysInEthiopianCycle)
        + ZMUtil::floorDiv(r, 365)
        - ZMUtil::floorDiv(r, kZMDaysInEthiopianCycle - 1);
    tracePrintf4("jdn %ld => cycle day %ld, year day %ld, year %ld", jdn, r, n, year);
    ethiopianDate->year = (int)year;
    ethiopianDate->month = (int)(ZMUtil::floorDiv(n, kZMDaysInEthiopianMonth) + 1);
    ethiopianDate->day = (int)(ZMUtil::floorMod(n, kZMDaysInEthiopianMonth) + 1);
    ZMAssert(ethiopianDate->day <= ZMCalendar_daysInEthiopianMonth(ethiopianDate->year, ethiopianDate->month));
    return ZMCalendarStatusOK;
}

ZMCalendarStatus
ZMCalendar_ethiopianToJDN(int               year,
                          int               month,
                          int               day,
                          ZMJulianDayNumber *jdn) {
    ZMAssert(jdn);
    if (day < 1 ||
        day > ZMCalendar_daysInEthiopianMonth(year, month)) {  // 0 for a bad month
        ZMCalendar_noteInvalidDate("ZMCalendar_ethiopianToJDN", year, month, day);
        return ZMCalendarStatusInvalidDate;
    }
    // Inverse of ZMCalendar_jdnToEthiopian, including its one-day shift
    *jdn = kZMEthiopianEpoch - 1
        + kZMDaysInEthiopianCycle * ZMUtil::floorDiv(year, 4)
        + 365 * ZMUtil::floorMod(year, 4)
        + kZMDaysInEthiopianMonth * (month - 1)
        + (day - 1);
    tracePrintf4("%d/%d/%d => jdn %ld", year, month, day, *jdn);
    return ZMCalendarStatusOK;
}

ZMCalendarStatus
ZMCalendar_ethiopianToGregorian(int              year,
                                int              month,
                                int              day,
                                ZMDateComponents *gregorianDate) {
    ZMJulianDayNumber jdn;
    ZMCalendarStatus status = ZMCalendar_ethiopianToJDN(year, month, day, &jdn);
    if (status != ZMCalendarStatusOK) {
        return status;
    }
    return ZMCalendar_jdnToGregorian(jdn, gregorianDate);
}
