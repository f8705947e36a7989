/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "Core/valvestatus.h"
#include "Elements/link.h"

#include <gtest/gtest.h>

namespace {

const double QTOL = 2.8e-5;
const double HTOL = 0.00015;
const double HSET = 20.0;

int next(int status, double q, double h1, double h2)
{
    return ValveStatus::prvStatus(status, q, h1, h2, HSET, QTOL, HTOL);
}

TEST(ValveStatusTest, ActiveTransitions)
{
    EXPECT_EQ(next(ValveStatus::ACTIVE, -0.01, 30.0, 20.0), ValveStatus::CLOSED);
    EXPECT_EQ(next(ValveStatus::ACTIVE, 0.01, 19.0, 18.0), ValveStatus::OPEN);
    EXPECT_EQ(next(ValveStatus::ACTIVE, 0.01, 30.0, 20.0), ValveStatus::ACTIVE);
    // ... within tolerance of the target
    EXPECT_EQ(next(ValveStatus::ACTIVE, 0.01, HSET - 0.0001, 20.0), ValveStatus::ACTIVE);
    EXPECT_EQ(next(ValveStatus::ACTIVE, -1.0e-5, 30.0, 20.0), ValveStatus::ACTIVE);
}

TEST(ValveStatusTest, OpenTransitions)
{
    EXPECT_EQ(next(ValveStatus::OPEN, -0.01, 10.0, 12.0), ValveStatus::CLOSED);
    EXPECT_EQ(next(ValveStatus::OPEN, 0.01, 25.0, 24.9), ValveStatus::ACTIVE);
    EXPECT_EQ(next(ValveStatus::OPEN, 0.01, 15.0, 14.9), ValveStatus::OPEN);
    EXPECT_EQ(next(ValveStatus::OPEN, 0.01, HSET + 0.0001, 19.9), ValveStatus::OPEN);
}

TEST(ValveStatusTest, ClosedTransitions)
{
    EXPECT_EQ(next(ValveStatus::CLOSED, 0.0, 15.0, 10.0), ValveStatus::OPEN);
    EXPECT_EQ(next(ValveStatus::CLOSED, 0.0, 30.0, 10.0), ValveStatus::ACTIVE);
    EXPECT_EQ(next(ValveStatus::CLOSED, 0.0, 30.0, 25.0), ValveStatus::CLOSED);
    EXPECT_EQ(next(ValveStatus::CLOSED, 0.0, 10.0, 15.0), ValveStatus::CLOSED);
    EXPECT_EQ(next(ValveStatus::CLOSED, 0.0, 15.0, 15.0 - 0.0001), ValveStatus::CLOSED);
}

// A second application of the transition table to the same hydraulic state
// leaves the status unchanged, as long as the state is physically possible:
// a valve can't carry reverse flow while its upstream head is the higher one.
TEST(ValveStatusTest, TransitionsSettleForConsistentStates)
{
    const double flows[] = {-0.01, -1.0e-5, 0.0, 1.0e-5, 0.01};
    const double heads[] = {0.0, 10.0, HSET - 0.0001, HSET, HSET + 0.0001, 25.0, 30.0};
    const int statuses[] = {ValveStatus::OPEN, ValveStatus::ACTIVE, ValveStatus::CLOSED};

    for (double q : flows)
    for (double h1 : heads)
    for (double h2 : heads)
    {
        if ( q < -QTOL && h1 > h2 + HTOL ) continue;
        for (int status : statuses)
        {
            int once = next(status, q, h1, h2);
            int twice = next(once, q, h1, h2);
            EXPECT_EQ(once, twice) << "status " << ValveStatus::statusStr(status)
                << " q " << q << " h1 " << h1 << " h2 " << h2;
        }
    }
}

TEST(ValveStatusTest, StatusChangeMessage)
{
    Link valve("V1", Link::VALVE);
    EXPECT_EQ(ValveStatus::writeStatusChange(&valve, ValveStatus::ACTIVE, ValveStatus::OPEN),
              "    Valve V1 status changed from ACTIVE to OPEN");
    EXPECT_EQ(ValveStatus::statusStr(ValveStatus::CLOSED), "CLOSED");
    EXPECT_EQ(ValveStatus::statusStr(7), "");
}

}  // namespace
