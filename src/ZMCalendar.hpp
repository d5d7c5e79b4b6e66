//
//  ZMCalendar.hpp
//  Emerald Sequoia LLC
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#ifndef ZMCALENDAR_HPP
#define ZMCALENDAR_HPP

// Continuous day count; 0001-01-01 (proleptic Gregorian) is day 1721426
typedef long ZMJulianDayNumber;

// A plain struct owned by the caller (and presumably almost always stack storage).
// Which calendar the fields belong to is determined by the function that fills it in.
struct ZMDateComponents {
    int year;
    int month;  // 1-12 Gregorian, 1-13 Ethiopian
    int day;
};

inline bool
operator==(const ZMDateComponents &a,
           const ZMDateComponents &b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

inline bool
operator!=(const ZMDateComponents &a,
           const ZMDateComponents &b) {
    return !(a == b);
}

enum ZMCalendarStatus {
    ZMCalendarStatusOK,
    ZMCalendarStatusInvalidDate,  // The (year, month, day) triple is not a date in the given calendar, or is out of range
    ZMCalendarStatusInvalidJDN,   // The Julian Day Number is outside the supported range
};

extern const char *
ZMCalendar_statusDescription(ZMCalendarStatus status);

// In every conversion below, the output parameter is written only when the
// return value is ZMCalendarStatusOK.

//********** Gregorian (proleptic, years 1-9999) **********

extern ZMCalendarStatus
ZMCalendar_gregorianToJDN(int               year,
                          int               month,
                          int               day,
                          ZMJulianDayNumber *jdn);

extern ZMCalendarStatus
ZMCalendar_jdnToGregorian(ZMJulianDayNumber jdn,
                          ZMDateComponents  *gregorianDate);

extern bool
ZMCalendar_isGregorianLeapYear(int year);

// Returns 0 if month is not in 1-12
extern int
ZMCalendar_daysInGregorianMonth(int year,
                                int month);

//********** Ethiopian **********

extern ZMCalendarStatus
ZMCalendar_jdnToEthiopian(ZMJulianDayNumber jdn,
                          ZMDateComponents  *ethiopianDate);

extern ZMCalendarStatus
ZMCalendar_ethiopianToJDN(int               year,
                          int               month,
                          int               day,
                          ZMJulianDayNumber *jdn);

extern bool
ZMCalendar_isEthiopianLeapYear(int year);

// Returns 0 if month is not in 1-13
extern int
ZMCalendar_daysInEthiopianMonth(int year,
                                int month);

//********** Between the two calendars **************

extern ZMCalendarStatus
ZMCalendar_gregorianToEthiopian(int              year,
                                int              month,
                                int              day,
                                ZMDateComponents *ethiopianDate);

extern ZMCalendarStatus
ZMCalendar_ethiopianToGregorian(int              year,
                                int              month,
                                int              day,
                                ZMDateComponents *gregorianDate);

//********** Days and instants **************

// 0 == Sunday
extern int
ZMCalendar_weekdayFromJDN(ZMJulianDayNumber jdn);

// The day containing the given instant (seconds since 1970-01-01 UTC) in a zone
// tzOffsetSeconds ahead of UTC.  InvalidJDN for a non-finite instant or one whose
// day is outside what the Ethiopian conversion accepts.
extern ZMCalendarStatus
ZMCalendar_jdnFromUnixTime(double            unixTime,
                           double            tzOffsetSeconds,
                           ZMJulianDayNumber *jdn);

extern ZMCalendarStatus
ZMCalendar_currentJDN(double            tzOffsetSeconds,
                      ZMJulianDayNumber *jdn);

#endif  // ZMCALENDAR_HPP
