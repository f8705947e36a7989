/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "Models/headlossmodel.h"
#include "Elements/link.h"
#include "Core/constants.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>

namespace {

class SmoothHeadLossTest : public ::testing::Test
{
  protected:
    SmoothHW_HeadLossModel model;
};

TEST_F(SmoothHeadLossTest, MatchesLaminarBranchBelowQ1)
{
    EXPECT_DOUBLE_EQ(model.lossFunction(0.001), 0.01 * 0.001);
    EXPECT_DOUBLE_EQ(model.lossGradient(0.002), 0.01);
    EXPECT_DOUBLE_EQ(model.lossFunction(0.0), 0.0);
}

TEST_F(SmoothHeadLossTest, MatchesHazenWilliamsAboveQ2)
{
    EXPECT_DOUBLE_EQ(model.lossFunction(0.05), std::pow(0.05, 1.852));
    EXPECT_NEAR(model.lossGradient(0.05), 1.852 * std::pow(0.05, 0.852), 1.0e-12);
}

TEST_F(SmoothHeadLossTest, IsContinuousAtBreakpoints)
{
    // ... the cubic section must reproduce both branches at its end points
    EXPECT_NEAR(model.lossFunction(HW_Q1), 0.01 * HW_Q1, 1.0e-12);
    EXPECT_NEAR(model.lossFunction(HW_Q2), std::pow(HW_Q2, 1.852), 1.0e-12);
    EXPECT_NEAR(model.lossGradient(HW_Q1), 0.01, 1.0e-9);
    EXPECT_NEAR(model.lossGradient(HW_Q2), 1.852 * std::pow(HW_Q2, 0.852), 1.0e-9);

    const double eps = 1.0e-10;
    for (double q : {HW_Q1, HW_Q2})
    {
        EXPECT_NEAR(model.lossFunction(q - eps), model.lossFunction(q + eps), 1.0e-10);
        EXPECT_NEAR(model.lossGradient(q - eps), model.lossGradient(q + eps), 1.0e-6);
    }
}

TEST_F(SmoothHeadLossTest, IsMonotonic)
{
    double last = model.lossFunction(0.0);
    for (int i = 1; i <= 2000; i++)
    {
        double q = i * 1.0e-5;
        double f = model.lossFunction(q);
        EXPECT_GT(f, last) << "at Q = " << q;
        last = f;
    }
}

TEST_F(SmoothHeadLossTest, GradientMatchesFiniteDifference)
{
    const double dq = 1.0e-8;
    for (double q : {0.001, 0.0040, 0.0045, 0.0050, 0.02, 0.3})
    {
        double fd = (model.lossFunction(q + dq) - model.lossFunction(q - dq)) / (2.0 * dq);
        EXPECT_NEAR(model.lossGradient(q), fd, 1.0e-5 * std::max(1.0, fd)) << "at Q = " << q;
    }
}

TEST(HeadLossModelTest, FactoryRecognizesModelNames)
{
    std::unique_ptr<HeadLossModel> smooth(HeadLossModel::factory("SMOOTH-H-W"));
    std::unique_ptr<HeadLossModel> hw(HeadLossModel::factory("H-W"));
    ASSERT_NE(smooth, nullptr);
    ASSERT_NE(hw, nullptr);
    EXPECT_EQ(smooth->name(), "SMOOTH-H-W");
    EXPECT_EQ(hw->name(), "H-W");
    EXPECT_EQ(HeadLossModel::factory("D-W"), nullptr);
}

TEST(HeadLossModelTest, PipeResistanceAndSignedLoss)
{
    Link pipe("P1", Link::PIPE);
    pipe.length = 1000.0;
    pipe.diameter = 0.3;
    pipe.roughness = 100.0;

    SmoothHW_HeadLossModel model;
    model.setResistance(&pipe);
    double k = 10.67 * std::pow(100.0, -1.852) * std::pow(0.3, -4.871) * 1000.0;
    EXPECT_NEAR(pipe.resistance, k, 1.0e-9 * k);

    double hLoss, hGrad;
    model.findHeadLoss(pipe.resistance, 0.05, hLoss, hGrad);
    EXPECT_NEAR(hLoss, k * std::pow(0.05, 1.852), 1.0e-9);
    double hLossRev, hGradRev;
    model.findHeadLoss(pipe.resistance, -0.05, hLossRev, hGradRev);
    EXPECT_DOUBLE_EQ(hLossRev, -hLoss);
    EXPECT_DOUBLE_EQ(hGradRev, hGrad);
}

TEST(HeadLossModelTest, ResistanceIgnoresNonPipes)
{
    Link pump("PU1", Link::PUMP);
    pump.resistance = 0.0;
    HW_HeadLossModel model;
    model.setResistance(&pump);
    EXPECT_EQ(pump.resistance, 0.0);
}

}  // namespace
