/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file demand.h
//! \brief Describes the Demand class.

#ifndef DEMAND_H_
#define DEMAND_H_

class Pattern;

//! \class Demand
//! \brief Specifies the rate of consumption at a junction node.

class Demand
{
  public:
    Demand();
    ~Demand();

    double getFullDemand(double multiplier, double t) const;

    double   baseDemand;        //!< baseline demand flow (m3/s)
    Pattern* timePattern;       //!< time pattern applied to the base demand
};

#endif
