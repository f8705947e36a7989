/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "Core/options.h"
#include "Core/error.h"
#include "Utilities/utilities.h"

#include <gtest/gtest.h>
#include <string>

namespace {

TEST(OptionsTest, Defaults)
{
    Options options;
    EXPECT_EQ(options.stringOption(Options::HEADLOSS_MODEL), "SMOOTH-H-W");
    EXPECT_EQ(options.stringOption(Options::NL_SOLVER), "POWELL");
    EXPECT_EQ(options.indexOption(Options::MAX_TRIALS), 10);
    EXPECT_EQ(options.indexOption(Options::HEAD_BOUNDS), 0);
    EXPECT_DOUBLE_EQ(options.valueOption(Options::HEAD_TOLERANCE), 0.00015);
    EXPECT_DOUBLE_EQ(options.valueOption(Options::FLOW_TOLERANCE), 2.8e-5);
    EXPECT_EQ(options.timeOption(Options::HYD_STEP), 3600);
    EXPECT_EQ(options.timeOption(Options::TOTAL_DURATION), 0);
}

TEST(OptionsTest, StringOptionsAcceptKnownChoices)
{
    Options options;
    EXPECT_EQ(options.setOption(Options::HEADLOSS_MODEL, "h-w"), 0);
    EXPECT_EQ(options.stringOption(Options::HEADLOSS_MODEL), "H-W");
    EXPECT_EQ(options.setOption(Options::NL_SOLVER, "NEWTON"), InputError::INVALID_KEYWORD);
    EXPECT_EQ(options.stringOption(Options::NL_SOLVER), "POWELL");
}

TEST(OptionsTest, ParsesKeywordValueLines)
{
    Options options;
    EXPECT_EQ(options.setOption("HYDRAULIC   TIMESTEP", "1:30"), 0);
    EXPECT_EQ(options.timeOption(Options::HYD_STEP), 5400);
    EXPECT_EQ(options.setOption("Duration", "24 HOURS"), 0);
    EXPECT_EQ(options.timeOption(Options::TOTAL_DURATION), 86400);
    EXPECT_EQ(options.setOption("PATTERN TIMESTEP", "30 MIN"), 0);
    EXPECT_EQ(options.timeOption(Options::PATTERN_STEP), 1800);
    EXPECT_EQ(options.setOption("START CLOCKTIME", "6 PM"), 0);
    EXPECT_EQ(options.timeOption(Options::START_TIME), 18 * 3600);

    EXPECT_EQ(options.setOption("TRIALS", "25"), 0);
    EXPECT_EQ(options.indexOption(Options::MAX_TRIALS), 25);
    EXPECT_EQ(options.setOption("HEAD BOUNDS", "YES"), 0);
    EXPECT_EQ(options.indexOption(Options::HEAD_BOUNDS), 1);
    EXPECT_EQ(options.setOption("STATUS", "FULL"), 0);
    EXPECT_EQ(options.indexOption(Options::REPORT_STATUS), 1);
    EXPECT_EQ(options.indexOption(Options::REPORT_TRIALS), 1);
    EXPECT_EQ(options.setOption("DEMAND MULTIPLIER", "1.5"), 0);
    EXPECT_DOUBLE_EQ(options.valueOption(Options::DEMAND_MULTIPLIER), 1.5);
    EXPECT_EQ(options.setOption("SOLVER", "LEVMAR"), 0);
    EXPECT_EQ(options.stringOption(Options::NL_SOLVER), "LEVMAR");
}

TEST(OptionsTest, ReportsBadEntries)
{
    Options options;
    EXPECT_EQ(options.setOption("QUALITY", "CHLORINE"), InputError::INVALID_KEYWORD);
    EXPECT_EQ(options.setOption("TRIALS", "ten"), InputError::INVALID_NUMBER);
    EXPECT_EQ(options.setOption("TRIALS", "0"), InputError::ILLEGAL_VALUE);
    EXPECT_EQ(options.setOption("ACCURACY", "-1"), InputError::ILLEGAL_VALUE);
    EXPECT_EQ(options.setOption("DURATION", "soon"), InputError::INVALID_TIME);
    EXPECT_EQ(options.setOption("HYDRAULIC TIMESTEP", "0"), InputError::ILLEGAL_VALUE);
    EXPECT_EQ(options.setOption("HEAD BOUNDS", ""), InputError::ILLEGAL_VALUE);
    EXPECT_EQ(options.indexOption(Options::MAX_TRIALS), 10);
}

TEST(OptionsTest, WritesSummaries)
{
    Options options;
    std::string hyd = options.hydOptionsToStr();
    EXPECT_NE(hyd.find("SMOOTH-H-W"), std::string::npos);
    EXPECT_NE(hyd.find("HEAD BOUNDS"), std::string::npos);
    std::string times = options.timeOptionsToStr();
    EXPECT_NE(times.find("1:00:00"), std::string::npos);
}

TEST(UtilitiesTest, TimeConversions)
{
    EXPECT_EQ(Utilities::getTime(3725), "1:02:05");
    EXPECT_EQ(Utilities::getTime(0), "0:00:00");
    EXPECT_EQ(Utilities::getSeconds("2.5", ""), 9000);
    EXPECT_EQ(Utilities::getSeconds("90", "SEC"), 90);
    EXPECT_EQ(Utilities::getSeconds("1", "DAYS"), 86400);
    EXPECT_EQ(Utilities::getSeconds("12", "AM"), 0);
    EXPECT_EQ(Utilities::getSeconds("1:00:30", ""), 3630);
    EXPECT_EQ(Utilities::getSeconds("1", "WEEKS"), -1);
    EXPECT_EQ(Utilities::getSeconds("-3", ""), -1);
    EXPECT_EQ(Utilities::getSeconds("1:30", ""), 5400);
    EXPECT_EQ(Utilities::getSeconds("1:00:30:15", ""), -1);
    EXPECT_EQ(Utilities::getSeconds("1:00:", ""), -1);
}

TEST(UtilitiesTest, KeywordMatching)
{
    const char* words[] = {"OPEN", "CLOSED", nullptr};
    EXPECT_EQ(Utilities::findMatch("closed", words), 1);
    EXPECT_EQ(Utilities::findMatch("CLOSE", words), -1);
    EXPECT_TRUE(Utilities::match("Pipe", "PIPE"));
    EXPECT_FALSE(Utilities::match("Pip\xe9", "PIPE"));
    EXPECT_EQ(Utilities::upperCase("hw\xe9"), "HW\xe9");
    double x;
    EXPECT_TRUE(Utilities::parseNumber("1.5e-3", x));
    EXPECT_DOUBLE_EQ(x, 1.5e-3);
    EXPECT_FALSE(Utilities::parseNumber("1.5x", x));
}

}  // namespace
