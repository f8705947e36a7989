/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file headlossmodel.h
//! \brief Describes the HeadLossModel class and its sub-classes.

#ifndef HEADLOSSMODEL_H_
#define HEADLOSSMODEL_H_

#include <string>

class Link;

//! \class HeadLossModel
//! \brief The interface for a pipe head loss model.
//!
//! A head loss model computes the friction head loss through a pipe as
//! resistance * sign(q) * lossFunction(|q|) together with its derivative
//! with respect to flow, which the nonlinear solver uses in its Jacobian.

class HeadLossModel
{
  public:
    HeadLossModel() {}
    virtual ~HeadLossModel() {}

    static HeadLossModel* factory(const std::string& model);

    virtual std::string name() const = 0;

    /// Loss curve evaluated at a non-negative flow magnitude
    virtual double lossFunction(double Q) const = 0;

    /// Derivative of the loss curve at a non-negative flow magnitude
    virtual double lossGradient(double Q) const = 0;

    void setResistance(Link* link) const;
    void findHeadLoss(double r, double q, double& hLoss, double& hGrad) const;
};

//-----------------------------------------------------------------------------
//! \class SmoothHW_HeadLossModel
//! \brief Hazen-Williams head loss blended with a linear law at low flow.
//!
//! Below q1 the loss is linear in flow and above q2 it follows the
//! Hazen-Williams power law. In between a cubic whose value and slope match
//! both branches keeps the loss and its derivative continuous, so the
//! Jacobian stays finite and non-zero as flow approaches zero.
//-----------------------------------------------------------------------------

class SmoothHW_HeadLossModel : public HeadLossModel
{
  public:
    SmoothHW_HeadLossModel();
    std::string name() const { return "SMOOTH-H-W"; }
    double lossFunction(double Q) const;
    double lossGradient(double Q) const;

    // Coefficients of the cubic a + b*Q + c*Q^2 + d*Q^3 on [q1, q2]
    double a, b, c, d;
};

//-----------------------------------------------------------------------------
//! \class HW_HeadLossModel
//! \brief The unmodified Hazen-Williams head loss law.
//-----------------------------------------------------------------------------

class HW_HeadLossModel : public HeadLossModel
{
  public:
    HW_HeadLossModel() {}
    std::string name() const { return "H-W"; }
    double lossFunction(double Q) const;
    double lossGradient(double Q) const;
};

#endif
