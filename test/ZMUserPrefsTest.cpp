//
//  ZMUserPrefsTest.cpp
//
//  Copyright Emerald Sequoia LLC 2024. All rights reserved.
//

#include <gtest/gtest.h>

#include "ZMCalendar.hpp"
#include "ZMErrorReporter.hpp"
#include "ZMUserPrefs.hpp"

#include <stdlib.h>

#include <string>

class ZMUserPrefsTest : public ::testing::Test {
  protected:
    virtual void TearDown() {
        ZMUserPrefs::removePref("ZMTestPref");
        ZMUserPrefs::removePref(ZMCalendarLogFailuresPref);
        unsetenv("ZMTestPref");
        unsetenv(ZMCalendarLogFailuresPref);
    }
};

TEST_F(ZMUserPrefsTest, UnsetPrefs) {
    EXPECT_FALSE(ZMUserPrefs::hasPref("ZMTestPref"));
    EXPECT_EQ("", ZMUserPrefs::stringPref("ZMTestPref"));
    EXPECT_FALSE(ZMUserPrefs::boolPref("ZMTestPref"));
}

TEST_F(ZMUserPrefsTest, SetAndRemove) {
    ZMUserPrefs::setPref("ZMTestPref", std::string("hello"));
    EXPECT_TRUE(ZMUserPrefs::hasPref("ZMTestPref"));
    EXPECT_EQ("hello", ZMUserPrefs::stringPref("ZMTestPref"));
    ZMUserPrefs::removePref("ZMTestPref");
    EXPECT_FALSE(ZMUserPrefs::hasPref("ZMTestPref"));
}

TEST_F(ZMUserPrefsTest, BoolValues) {
    ZMUserPrefs::setPref("ZMTestPref", true);
    EXPECT_TRUE(ZMUserPrefs::boolPref("ZMTestPref"));
    EXPECT_EQ("true", ZMUserPrefs::stringPref("ZMTestPref"));
    ZMUserPrefs::setPref("ZMTestPref", false);
    EXPECT_FALSE(ZMUserPrefs::boolPref("ZMTestPref"));

    const char *yes[] = { "1", "TRUE", "Yes" };
    for (size_t i = 0; i < sizeof(yes) / sizeof(yes[0]); i++) {
        ZMUserPrefs::setPref("ZMTestPref", std::string(yes[i]));
        EXPECT_TRUE(ZMUserPrefs::boolPref("ZMTestPref")) << yes[i];
    }

    testing::internal::CaptureStderr();
    ZMUserPrefs::setPref("ZMTestPref", std::string("maybe"));
    EXPECT_FALSE(ZMUserPrefs::boolPref("ZMTestPref"));
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_NE(std::string::npos, output.find("maybe"));
}

TEST_F(ZMUserPrefsTest, EnvironmentFallback) {
    setenv("ZMTestPref", "from-env", 1);
    EXPECT_TRUE(ZMUserPrefs::hasPref("ZMTestPref"));
    EXPECT_EQ("from-env", ZMUserPrefs::stringPref("ZMTestPref"));
    ZMUserPrefs::setPref("ZMTestPref", std::string("in-process"));
    EXPECT_EQ("in-process", ZMUserPrefs::stringPref("ZMTestPref"));
    ZMUserPrefs::removePref("ZMTestPref");
    EXPECT_EQ("from-env", ZMUserPrefs::stringPref("ZMTestPref"));
}

TEST_F(ZMUserPrefsTest, ConversionFailuresAreSilentByDefault) {
    ZMUserPrefs::removePref(ZMCalendarLogFailuresPref);
    unsetenv(ZMCalendarLogFailuresPref);
    ASSERT_FALSE(ZMUserPrefs::hasPref(ZMCalendarLogFailuresPref));
    ZMJulianDayNumber jdn;
    ZMDateComponents cs;
    testing::internal::CaptureStderr();
    EXPECT_EQ(ZMCalendarStatusInvalidDate, ZMCalendar_gregorianToJDN(2023, 2, 30, &jdn));
    EXPECT_EQ(ZMCalendarStatusInvalidJDN, ZMCalendar_jdnToGregorian(0, &cs));
    EXPECT_EQ("", testing::internal::GetCapturedStderr());
}

TEST_F(ZMUserPrefsTest, ConversionFailuresSilentWhenExplicitlyOff) {
    ZMUserPrefs::setPref(ZMCalendarLogFailuresPref, false);
    ZMJulianDayNumber jdn;
    testing::internal::CaptureStderr();
    EXPECT_EQ(ZMCalendarStatusInvalidDate, ZMCalendar_gregorianToJDN(2023, 2, 30, &jdn));
    EXPECT_EQ("", testing::internal::GetCapturedStderr());
}

static size_t
countOccurrences(const std::string &haystack,
                 const std::string &needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

// An unparseable switch value is reported at most once, not on every rejected input
TEST_F(ZMUserPrefsTest, UnparseableLogSwitchWarnsOnce) {
    setenv(ZMCalendarLogFailuresPref, "sometimes", 1);
    ZMJulianDayNumber jdn;
    testing::internal::CaptureStderr();
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(ZMCalendarStatusInvalidDate, ZMCalendar_gregorianToJDN(2023, 2, 30, &jdn));
    }
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_EQ(1u, countOccurrences(output, "ZMUserPrefs"));
    EXPECT_EQ(0u, countOccurrences(output, "ZMCalendar_gregorianToJDN"));
}

TEST_F(ZMUserPrefsTest, ConversionFailuresLoggedWhenEnabled) {
    ZMUserPrefs::setPref(ZMCalendarLogFailuresPref, true);
    ZMJulianDayNumber jdn;
    ZMDateComponents cs;
    testing::internal::CaptureStderr();
    EXPECT_EQ(ZMCalendarStatusInvalidDate, ZMCalendar_gregorianToJDN(2023, 2, 30, &jdn));
    EXPECT_EQ(ZMCalendarStatusInvalidJDN, ZMCalendar_jdnToEthiopian(12, &cs));
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_NE(std::string::npos, output.find("ZMCalendar_gregorianToJDN"));
    EXPECT_NE(std::string::npos, output.find("2023/02/30"));
    EXPECT_NE(std::string::npos, output.find("ZMCalendar_jdnToEthiopian"));
    EXPECT_NE(std::string::npos, output.find("Invalid Julian Day Number: 12"));
}

TEST(ZMErrorReporter, WritesOneTaggedLine) {
    testing::internal::CaptureStderr();
    ZMErrorReporter::logInfo("ZMErrorReporterTest", "value %d", 7);
    ZMErrorReporter::logErrorWithCode("ZMErrorReporterTest", 3, "bad %s", "thing");
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_EQ("INFO ZMErrorReporterTest: value 7\nERROR(3) ZMErrorReporterTest: bad thing\n", output);
}

TEST(ZMErrorReporter, MarksTruncatedMessages) {
    std::string longMessage(2000, 'x');
    testing::internal::CaptureStderr();
    ZMErrorReporter::logInfo("ZMErrorReporterTest", "%s", longMessage.c_str());
    ZMErrorReporter::logInfo("ZMErrorReporterTest", "%s", std::string(1023, 'y').c_str());
    std::string output = testing::internal::GetCapturedStderr();
    std::string expected = "INFO ZMErrorReporterTest: " + std::string(1023, 'x') + "...[truncated]\n"
        + "INFO ZMErrorReporterTest: " + std::string(1023, 'y') + "\n";
    EXPECT_EQ(expected, output);
}
