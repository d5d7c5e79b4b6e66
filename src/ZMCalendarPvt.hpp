//
//  ZMCalendarPvt.hpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#ifndef _ZMCALENDARPVT_HPP_
#define _ZMCALENDARPVT_HPP_

#include "ZMCalendar.hpp"

#define kZMGregorianOrdinalOffset (1721425)    // JDN - (proleptic ordinal day, 0001-01-01 == 1)
#define kZMMinimumGregorianYear (1)
#define kZMMaximumGregorianYear (9999)
#define kZMMaximumGregorianJDN (5373484)       // 9999-12-31
#define kZMMinimumSupportedJDN (1721425)       // Below this nothing converts
#define kZMJDNBeforeMarchYear0 (1721119)       // 0000-03-01 is the next day
#define kZMDaysInGregorianCycle (146097)       // 400 years
#define kZMDaysInNonLeapCentury (36525)

#define kZMEthiopianEpoch (1723856)
#define kZMDaysInEthiopianCycle (1461)         // 3 * 365 + 366
#define kZMDaysInEthiopianMonth (30)
#define kZMEthiopianMonthsInYear (13)
#define kZMMaximumEthiopianJDN (784370126286L) // Last day of Pagume, Ethiopian year INT_MAX

#define kZMUnixEpochJDN (2440588)              // 1970-01-01
#define kZMSecondsInDay (86400.0)

// Report a rejected input, if ZMCalendarLogFailuresPref is set
extern void
ZMCalendar_noteInvalidDate(const char *who,
                           int        year,
                           int        month,
                           int        day);

extern void
ZMCalendar_noteInvalidJDN(const char        *who,
                          ZMJulianDayNumber jdn);

#endif  // _ZMCALENDARPVT_HPP_
