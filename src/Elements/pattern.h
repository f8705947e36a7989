/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file pattern.h
//! \brief Describes the Pattern class.

#ifndef PATTERN_H_
#define PATTERN_H_

#include "Elements/element.h"

#include <string>
#include <vector>

class MemPool;

//! \class Pattern
//! \brief A set of multiplying factors applied to a demand over time.
//!
//! Factors are applied in fixed time intervals (the PATTERN_STEP option)
//! and the pattern repeats once its last factor has been used.

class Pattern: public Element
{
  public:

    Pattern(std::string name_);
    ~Pattern();

    static Pattern* factory(std::string name_, MemPool* memPool);

    void   init(int intrvl, int tStart);
    void   addFactor(double f) { factors.push_back(f); }
    int    size() const { return static_cast<int>(factors.size()); }
    double factor(int i) const { return factors[i]; }
    double factorAt(double t) const;

  private:
    std::vector<double> factors;     //!< sequence of multiplier factors
    int                 interval;    //!< time interval between factors (sec)
    int                 startTime;   //!< offset into the pattern at time 0 (sec)
};

#endif
