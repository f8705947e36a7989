/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "headlossmodel.h"
#include "Elements/link.h"
#include "Core/constants.h"

#include <cmath>
using namespace std;

//-----------------------------------------------------------------------------
//    Parent Head Loss Model Class
//-----------------------------------------------------------------------------

HeadLossModel* HeadLossModel::factory(const string& model)
{
    if ( model == "SMOOTH-H-W" ) return new SmoothHW_HeadLossModel();
    if ( model == "H-W" ) return new HW_HeadLossModel();
    return nullptr;
}

//-----------------------------------------------------------------------------

//  Computes a pipe's Hazen-Williams resistance coefficient.

void HeadLossModel::setResistance(Link* link) const
{
    if ( link->type != Link::PIPE ) return;
    link->resistance = HW_COEFF * pow(link->roughness, -HW_EXP) *
                       pow(link->diameter, -HW_DIAM_EXP) * link->length;
}

//-----------------------------------------------------------------------------

//  Finds the head loss through a pipe of resistance r and its gradient with
//  respect to flow.

void HeadLossModel::findHeadLoss(double r, double q, double& hLoss,
                                 double& hGrad) const
{
    double Q = abs(q);
    hLoss = r * lossFunction(Q);
    if ( q < 0.0 ) hLoss = -hLoss;
    hGrad = r * lossGradient(Q);
}

//-----------------------------------------------------------------------------
//    Smoothed Hazen-Williams Head Loss Model
//-----------------------------------------------------------------------------

SmoothHW_HeadLossModel::SmoothHW_HeadLossModel()
{
    // ... end point values and slopes of the two branches
    double q1 = HW_Q1;
    double q2 = HW_Q2;
    double f1 = HW_LAMINAR_SLOPE * q1;
    double g1 = HW_LAMINAR_SLOPE;
    double f2 = pow(q2, HW_EXP);
    double g2 = HW_EXP * pow(q2, HW_EXP - 1.0);

    // ... cubic Hermite interpolant in s = Q - q1
    double h = q2 - q1;
    double s = (f2 - f1) / h;
    double c2 = (3.0 * s - 2.0 * g1 - g2) / h;
    double c3 = (g1 + g2 - 2.0 * s) / (h * h);

    // ... expand to powers of Q
    a = f1 - g1 * q1 + c2 * q1 * q1 - c3 * q1 * q1 * q1;
    b = g1 - 2.0 * c2 * q1 + 3.0 * c3 * q1 * q1;
    c = c2 - 3.0 * c3 * q1;
    d = c3;
}

double SmoothHW_HeadLossModel::lossFunction(double Q) const
{
    if ( Q < HW_Q1 ) return HW_LAMINAR_SLOPE * Q;
    if ( Q > HW_Q2 ) return pow(Q, HW_EXP);
    return a + Q * (b + Q * (c + Q * d));
}

double SmoothHW_HeadLossModel::lossGradient(double Q) const
{
    if ( Q < HW_Q1 ) return HW_LAMINAR_SLOPE;
    if ( Q > HW_Q2 ) return HW_EXP * pow(Q, HW_EXP - 1.0);
    return b + Q * (2.0 * c + 3.0 * d * Q);
}

//-----------------------------------------------------------------------------
//    Hazen-Williams Head Loss Model
//-----------------------------------------------------------------------------

double HW_HeadLossModel::lossFunction(double Q) const
{
    return Q * pow(Q, HW_EXP - 1.0);
}

double HW_HeadLossModel::lossGradient(double Q) const
{
    return HW_EXP * pow(Q, HW_EXP - 1.0);
}
