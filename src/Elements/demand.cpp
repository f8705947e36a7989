/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "demand.h"
#include "pattern.h"

//-----------------------------------------------------------------------------

//  Demand Constructor

Demand::Demand() :
    baseDemand(0.0),
    timePattern(nullptr)
{
}

//-----------------------------------------------------------------------------

//  Demand Destructor

Demand::~Demand() {}

//-----------------------------------------------------------------------------

//    Find the pattern-adjusted required demand at elapsed time t (sec).

double Demand::getFullDemand(double multiplier, double t) const
{
    double patternFactor = 1.0;
    if ( timePattern ) patternFactor = timePattern->factorAt(t);
    return multiplier * baseDemand * patternFactor;
}
