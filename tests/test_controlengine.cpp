/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "Core/controlengine.h"
#include "Core/network.h"
#include "Core/error.h"
#include "Elements/node.h"
#include "Elements/link.h"
#include "Elements/control.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace {

bool contains(const std::vector<Link*>& links, Link* link)
{
    return std::find(links.begin(), links.end(), link) != links.end();
}

class ControlEngineTest : public ::testing::Test
{
  protected:
    void SetUp()
    {
        nw.addReservoir("R1", 100.0);
        tank = nw.addTank("T1", 50.0, 20.0, 0.0, 20.0, 10.0);
        nw.addJunction("J1", 0.0, 0.0);
        pipe = nw.addPipe("P1", "R1", "T1", 1000.0, 0.3, 100.0);
        nw.addPipe("P2", "T1", "J1", 1000.0, 0.3, 100.0);
        tankHead.assign(nw.count(Element::NODE), 0.0);
    }

    void setLevel(double level) { tankHead[tank->index] = tank->elev + level; }

    Network nw;
    Node* tank;
    Link* pipe;
    ControlEngine engine;
    std::vector<double> tankHead;
    std::vector<Link*> ctrlClosed, schedClosed, reopened;
};

TEST_F(ControlEngineTest, ClosesLinkAboveLevel)
{
    nw.addConditionalControl("P1", ConditionalControl::CLOSED_ABOVE, "T1", 15.0);
    engine.open(&nw);

    setLevel(14.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_TRUE(ctrlClosed.empty());

    setLevel(15.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    ASSERT_EQ(ctrlClosed.size(), 1u);
    EXPECT_EQ(ctrlClosed[0], pipe);

    // ... a closed link is not added twice
    setLevel(18.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_EQ(ctrlClosed.size(), 1u);
}

TEST_F(ControlEngineTest, OpensControlClosedLink)
{
    nw.addConditionalControl("P1", ConditionalControl::CLOSED_ABOVE, "T1", 15.0);
    nw.addConditionalControl("P1", ConditionalControl::OPEN_BELOW, "T1", 5.0);
    engine.open(&nw);

    ctrlClosed.push_back(pipe);
    setLevel(4.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_FALSE(contains(ctrlClosed, pipe));
    EXPECT_TRUE(reopened.empty());
}

TEST_F(ControlEngineTest, ReopensScheduledClosureOfClosedLinkPermanently)
{
    pipe->initStatus = Link::LINK_CLOSED;
    nw.addConditionalControl("P1", ConditionalControl::OPEN_BELOW, "T1", 5.0);
    engine.open(&nw);

    ctrlClosed.push_back(pipe);
    schedClosed.push_back(pipe);
    setLevel(5.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_TRUE(ctrlClosed.empty());
    EXPECT_TRUE(schedClosed.empty());
    ASSERT_EQ(reopened.size(), 1u);
    EXPECT_EQ(reopened[0], pipe);
}

TEST_F(ControlEngineTest, ScheduledClosureOfOpenLinkIsNotPermanent)
{
    nw.addConditionalControl("P1", ConditionalControl::OPEN_ABOVE, "T1", 12.0);
    engine.open(&nw);

    ctrlClosed.push_back(pipe);
    schedClosed.push_back(pipe);
    setLevel(13.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_TRUE(ctrlClosed.empty());
    EXPECT_TRUE(schedClosed.empty());
    EXPECT_TRUE(reopened.empty());
}

TEST_F(ControlEngineTest, OpenRuleLeavesScheduleOnlyClosureAlone)
{
    pipe->initStatus = Link::LINK_CLOSED;
    nw.addConditionalControl("P1", ConditionalControl::OPEN_BELOW, "T1", 100.0);
    nw.addConditionalControl("P1", ConditionalControl::OPEN_ABOVE, "T1", 0.0);
    engine.open(&nw);

    schedClosed.push_back(pipe);
    setLevel(10.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_TRUE(contains(schedClosed, pipe));
    EXPECT_TRUE(ctrlClosed.empty());
    EXPECT_TRUE(reopened.empty());
}

TEST_F(ControlEngineTest, LaterCategoriesWinWithinOneCall)
{
    // ... open-below is evaluated before closed-above, so the closure stands
    nw.addConditionalControl("P1", ConditionalControl::OPEN_BELOW, "T1", 10.0);
    nw.addConditionalControl("P1", ConditionalControl::CLOSED_ABOVE, "T1", 8.0);
    engine.open(&nw);

    setLevel(9.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_TRUE(contains(ctrlClosed, pipe));

    // ... and on the next call open-below lifts it before closed-above acts again
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_TRUE(contains(ctrlClosed, pipe));
}

TEST_F(ControlEngineTest, ClosedBelowIsEvaluatedLast)
{
    nw.addConditionalControl("P1", ConditionalControl::OPEN_ABOVE, "T1", 1.0);
    nw.addConditionalControl("P1", ConditionalControl::CLOSED_BELOW, "T1", 3.0);
    engine.open(&nw);

    ctrlClosed.push_back(pipe);
    setLevel(2.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_TRUE(contains(ctrlClosed, pipe));
}

TEST_F(ControlEngineTest, LogsActionsWhenReportingStatus)
{
    nw.options.setOption(Options::REPORT_STATUS, 1);
    nw.addConditionalControl("P1", ConditionalControl::CLOSED_ABOVE, "T1", 15.0);
    engine.open(&nw);

    setLevel(16.0);
    engine.apply(tankHead, ctrlClosed, schedClosed, reopened);
    EXPECT_NE(nw.msgLog.str().find("Pipe P1 closed by level of tank T1"), std::string::npos);
}

TEST_F(ControlEngineTest, RejectsJunctionTrigger)
{
    nw.addConditionalControl("P1", ConditionalControl::CLOSED_ABOVE, "J1", 15.0);
    try
    {
        engine.open(&nw);
        FAIL() << "expected a NetworkError";
    }
    catch (const NetworkError& e)
    {
        EXPECT_EQ(e.code, NetworkError::ILLEGAL_CONTROL_NODE);
        EXPECT_NE(e.msg.find("P1"), std::string::npos);
    }
}

}  // namespace
