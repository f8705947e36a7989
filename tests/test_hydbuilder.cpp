/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "Core/hydbuilder.h"
#include "Core/network.h"
#include "Core/simstate.h"
#include "Core/valvestatus.h"
#include "Core/constants.h"
#include "Core/error.h"
#include "Elements/node.h"
#include "Elements/link.h"
#include "Elements/pattern.h"
#include "Models/headlossmodel.h"
#include "Solvers/eqnsystem.h"

#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>

namespace {

// R1 -- P1 -- J1 -- P2 -- T1, plus a valve V1 from J1 to J2
class HydBuilderTest : public ::testing::Test
{
  protected:
    void SetUp()
    {
        nw.addReservoir("R1", 100.0);
        nw.addJunction("J1", 5.0, 0.02);
        nw.addTank("T1", 50.0, 20.0, 0.0, 20.0, 10.0);
        nw.addJunction("J2", 2.0, 0.01);
        nw.addPipe("P1", "R1", "J1", 1000.0, 0.3, 100.0);
        nw.addPipe("P2", "J1", "T1", 1000.0, 0.3, 100.0);
        nw.addValve("V1", "J1", "J2", 0.2, 30.0);
        nw.options.setOption(Options::TOTAL_DURATION, 2 * 3600);
    }

    void openBuilder()
    {
        ASSERT_TRUE(nw.createHeadLossModel());
        for (Pattern* p : nw.patterns) p->init(3600, 0);
        for (Link* link : nw.links) nw.headLossModel->setResistance(link);
        builder.open(&nw);
        closed.assign(nw.count(Element::LINK), 0);
        valveStatus.assign(nw.count(Element::LINK), ValveStatus::ACTIVE);
        tankHead.assign(nw.count(Element::NODE), 0.0);
        tankHead[nw.node("T1")->index] = 60.0;
    }

    void build(bool first, bool bounds = false)
    {
        builder.buildInstant(sys, idx, 0, first, tankHead, closed, valveStatus, bounds);
    }

    int findEquation(const std::string& name)
    {
        for (int i = 0; i < sys.equationCount(); i++)
        {
            if ( sys.equation(i).name == name ) return i;
        }
        return -1;
    }

    Network nw;
    HydBuilder builder;
    EquationSystem sys;
    InstantIndex idx;
    std::vector<char> closed;
    std::vector<int> valveStatus;
    std::vector<double> tankHead;
};

TEST_F(HydBuilderTest, FirstInstantIsSquare)
{
    openBuilder();
    build(true);
    EXPECT_EQ(sys.equationCount(), sys.freeVariableCount());
    EXPECT_EQ(findEquation("tank[T1]"), -1);

    // ... fixed values
    const Variable& tank = sys.variable(idx.head[nw.node("T1")->index]);
    EXPECT_TRUE(tank.fixed);
    EXPECT_DOUBLE_EQ(tank.value, 60.0);
    const Variable& res = sys.variable(idx.head[nw.node("R1")->index]);
    EXPECT_TRUE(res.fixed);
    EXPECT_DOUBLE_EQ(res.value, 100.0);
    const Variable& demand = sys.variable(idx.nodeFlow[nw.node("J1")->index]);
    EXPECT_TRUE(demand.fixed);
    EXPECT_DOUBLE_EQ(demand.value, 0.02);
}

TEST_F(HydBuilderTest, LaterInstantIsSquare)
{
    openBuilder();
    build(false);
    EXPECT_EQ(sys.equationCount(), sys.freeVariableCount());
    EXPECT_FALSE(sys.variable(idx.head[nw.node("T1")->index]).fixed);
    EXPECT_GE(findEquation("tank[T1]"), 0);
}

TEST_F(HydBuilderTest, InitialGuesses)
{
    openBuilder();
    build(false);
    EXPECT_DOUBLE_EQ(sys.value("flow[P1]"), INIT_FLOW);
    EXPECT_DOUBLE_EQ(sys.value("flow[V1]"), INIT_FLOW);
    EXPECT_DOUBLE_EQ(sys.value("head[J1]"), 5.0);
    EXPECT_DOUBLE_EQ(sys.value("head[T1]"), 50.0);
    EXPECT_DOUBLE_EQ(sys.value("inflow[T1]"), INIT_NODE_FLOW);
    EXPECT_DOUBLE_EQ(sys.value("outflow[R1]"), INIT_NODE_FLOW);
}

TEST_F(HydBuilderTest, MassBalanceAtJunction)
{
    openBuilder();
    build(true);
    int eqn = findEquation("balance[J1]");
    ASSERT_GE(eqn, 0);

    // ... 0.05 in through P1, 0.02 out through P2, 0.01 out through V1
    std::vector<double> x = sys.values();
    x[idx.flow[nw.link("P1")->index]] = 0.05;
    x[idx.flow[nw.link("P2")->index]] = 0.02;
    x[idx.flow[nw.link("V1")->index]] = 0.01;
    EXPECT_NEAR(sys.residual(eqn, x), 0.0, 1.0e-15);

    x[idx.flow[nw.link("V1")->index]] = 0.0;
    EXPECT_NEAR(sys.residual(eqn, x), 0.01, 1.0e-15);
}

TEST_F(HydBuilderTest, MassBalanceAtReservoirAndTank)
{
    openBuilder();
    build(false);
    std::vector<double> x = sys.values();
    x[idx.flow[nw.link("P1")->index]] = 0.05;
    x[idx.flow[nw.link("P2")->index]] = 0.02;

    // ... a supplying reservoir has a negative outflow
    x[idx.nodeFlow[nw.node("R1")->index]] = -0.05;
    EXPECT_NEAR(sys.residual(findEquation("balance[R1]"), x), 0.0, 1.0e-15);
    x[idx.nodeFlow[nw.node("T1")->index]] = 0.02;
    EXPECT_NEAR(sys.residual(findEquation("balance[T1]"), x), 0.0, 1.0e-15);
}

TEST_F(HydBuilderTest, TankUpdateFromLastHead)
{
    openBuilder();
    build(false);
    int eqn = findEquation("tank[T1]");
    ASSERT_GE(eqn, 0);

    double area = PI * 20.0 * 20.0 / 4.0;
    double inflow = 0.2;
    std::vector<double> x = sys.values();
    int t1 = nw.node("T1")->index;
    x[idx.nodeFlow[t1]] = inflow;
    x[idx.head[t1]] = 60.0 + inflow * 3600.0 / area;
    EXPECT_NEAR(sys.residual(eqn, x), 0.0, 1.0e-10);

    // ... and recovering the inflow from the two heads
    x[idx.nodeFlow[t1]] = 0.0;
    double recovered = (x[idx.head[t1]] - 60.0) * area / 3600.0;
    x[idx.nodeFlow[t1]] = recovered;
    EXPECT_NEAR(sys.residual(eqn, x), 0.0, 1.0e-10);
    EXPECT_NEAR(recovered, inflow, 1.0e-12);
}

TEST_F(HydBuilderTest, ClosedLinkHasNoEquation)
{
    openBuilder();
    closed[nw.link("P2")->index] = 1;
    build(true);
    EXPECT_EQ(findEquation("headloss[P2]"), -1);
    EXPECT_GE(findEquation("headloss[P1]"), 0);
    const Variable& q = sys.variable(idx.flow[nw.link("P2")->index]);
    EXPECT_TRUE(q.fixed);
    EXPECT_EQ(q.value, 0.0);
    EXPECT_EQ(sys.equationCount(), sys.freeVariableCount());
}

TEST_F(HydBuilderTest, ValveConstraintFollowsStatus)
{
    openBuilder();
    int v1 = nw.link("V1")->index;
    int j2 = nw.node("J2")->index;

    build(true);
    EXPECT_TRUE(sys.variable(idx.head[j2]).fixed);
    EXPECT_DOUBLE_EQ(sys.variable(idx.head[j2]).value, 32.0);
    EXPECT_EQ(findEquation("valve[V1]"), -1);

    EquationSystem open;
    valveStatus[v1] = ValveStatus::OPEN;
    builder.buildInstant(open, idx, 0, true, tankHead, closed, valveStatus, false);
    EXPECT_FALSE(open.variable(idx.head[j2]).fixed);
    EXPECT_EQ(open.equationCount(), open.freeVariableCount());
    bool found = false;
    for (int i = 0; i < open.equationCount(); i++)
    {
        if ( open.equation(i).name == "valve[V1]" ) found = true;
    }
    EXPECT_TRUE(found);

    EquationSystem shut;
    valveStatus[v1] = ValveStatus::CLOSED;
    builder.buildInstant(shut, idx, 0, true, tankHead, closed, valveStatus, false);
    EXPECT_TRUE(shut.variable(idx.flow[v1]).fixed);
    EXPECT_EQ(shut.value(idx.flow[v1]), 0.0);
    EXPECT_EQ(shut.equationCount(), shut.freeVariableCount());
}

TEST_F(HydBuilderTest, HeadBoundsOnlyWhenRequested)
{
    openBuilder();
    build(false, false);
    EXPECT_TRUE(std::isinf(sys.variable(idx.head[nw.node("J1")->index]).lower));

    EquationSystem bounded;
    builder.buildInstant(bounded, idx, 0, false, tankHead, closed, valveStatus, true);
    EXPECT_DOUBLE_EQ(bounded.variable(idx.head[nw.node("J1")->index]).lower, 5.0);
    const Variable& tank = bounded.variable(idx.head[nw.node("T1")->index]);
    EXPECT_DOUBLE_EQ(tank.lower, 50.0);
    EXPECT_DOUBLE_EQ(tank.upper, 70.0);
}

TEST_F(HydBuilderTest, PumpEquationsAndFlowBound)
{
    nw.addReservoir("R2", 10.0);
    nw.addHeadPump("PU1", "R2", "J2", 60.0, 1000.0, 2.0, 0.15);
    nw.addPowerPump("PU2", "R2", "J1", 5000.0);
    openBuilder();
    build(false, true);
    EXPECT_GE(findEquation("pumphead[PU1]"), 0);
    EXPECT_GE(findEquation("pumppower[PU2]"), 0);
    EXPECT_DOUBLE_EQ(sys.value("flow[PU1]"), 0.15);
    EXPECT_DOUBLE_EQ(sys.value("flow[PU2]"), INIT_FLOW);
    EXPECT_NEAR(sys.value("head[J1]"),
                10.0 + 5000.0 / (GRAVITY * WATER_DENSITY * INIT_FLOW), 1.0e-9);
    EXPECT_DOUBLE_EQ(sys.variable(sys.variableIndex("flow[PU1]")).lower, 0.0);
    EXPECT_EQ(sys.equationCount(), sys.freeVariableCount());
}

TEST_F(HydBuilderTest, RejectsCheckValves)
{
    openBuilder();
    nw.link("P2")->initStatus = Link::LINK_CV;
    try
    {
        build(true);
        FAIL() << "expected an InputError";
    }
    catch (const InputError& e)
    {
        EXPECT_EQ(e.code, InputError::CHECK_VALVE_NOT_SUPPORTED);
        EXPECT_NE(e.msg.find("P2"), std::string::npos);
    }
    EXPECT_EQ(sys.variableCount(), 0);
}

TEST_F(HydBuilderTest, RejectsUnknownPumpType)
{
    Link* pump = nw.addHeadPump("PU1", "R1", "J2", 60.0, 1000.0, 2.0, 0.15);
    pump->pumpType = 5;
    openBuilder();
    try
    {
        build(true);
        FAIL() << "expected an InputError";
    }
    catch (const InputError& e)
    {
        EXPECT_EQ(e.code, InputError::INVALID_PUMP_CURVE);
        EXPECT_NE(e.msg.find("PU1"), std::string::npos);
    }
}

TEST_F(HydBuilderTest, RejectsInconsistentTopology)
{
    openBuilder();
    // ... P2 is still listed as a link of T1 but no longer ends there
    nw.link("P2")->toNode = nw.node("J2");
    try
    {
        build(true);
        FAIL() << "expected a NetworkError";
    }
    catch (const NetworkError& e)
    {
        EXPECT_EQ(e.code, NetworkError::INCONSISTENT_TOPOLOGY);
    }
}

TEST_F(HydBuilderTest, HorizonSpansAllPeriods)
{
    openBuilder();
    SimulationState state;
    state.init(&nw);
    std::vector<InstantIndex> periods;
    builder.buildHorizon(sys, periods, state);

    ASSERT_EQ(periods.size(), 3u);
    EXPECT_EQ(sys.equationCount(), sys.freeVariableCount());
    EXPECT_GE(sys.variableIndex("flow[P1,0]"), 0);
    EXPECT_GE(sys.variableIndex("head[T1,2]"), 0);
    EXPECT_EQ(sys.variableIndex("flow[P1]"), -1);

    // ... only the first period's tank head is fixed
    int t1 = nw.node("T1")->index;
    EXPECT_TRUE(sys.variable(periods[0].head[t1]).fixed);
    EXPECT_FALSE(sys.variable(periods[1].head[t1]).fixed);

    // ... bounds always apply
    EXPECT_DOUBLE_EQ(sys.variable(periods[2].head[nw.node("J1")->index]).lower, 5.0);
    EXPECT_GE(findEquation("tank[T1,1]"), 0);
    EXPECT_EQ(findEquation("tank[T1,0]"), -1);
}

TEST_F(HydBuilderTest, HorizonHonorsSchedule)
{
    nw.addTimeControl("P2", 3600, Link::LINK_CLOSED);
    openBuilder();
    SimulationState state;
    state.init(&nw);
    std::vector<InstantIndex> periods;
    builder.buildHorizon(sys, periods, state);

    EXPECT_GE(findEquation("headloss[P2,0]"), 0);
    EXPECT_EQ(findEquation("headloss[P2,1]"), -1);
    EXPECT_TRUE(sys.variable(sys.variableIndex("flow[P2,2]")).fixed);
}

TEST(HydBuilderNamesTest, VariableNames)
{
    EXPECT_EQ(HydBuilder::varName("flow", "P1", -1), "flow[P1]");
    EXPECT_EQ(HydBuilder::varName("head", "J7", 12), "head[J7,12]");
}

}  // namespace
