/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "pattern.h"
#include "Utilities/mempool.h"

#include <new>
using namespace std;

//-----------------------------------------------------------------------------

// Pattern Factory

Pattern* Pattern::factory(string name_, MemPool* memPool)
{
    return new(memPool->alloc(sizeof(Pattern))) Pattern(name_);
}

//-----------------------------------------------------------------------------

// Pattern Constructor/Destructor

Pattern::Pattern(string name_) :
    Element(name_),
    interval(0),
    startTime(0)
{}

Pattern::~Pattern()
{
    factors.clear();
}

//-----------------------------------------------------------------------------

//  Sets the pattern's time interval and starting offset (sec).

void Pattern::init(int intrvl, int tStart)
{
    interval = intrvl;
    startTime = tStart;
    if ( factors.size() == 0 ) factors.push_back(1.0);
}

//-----------------------------------------------------------------------------

//  Returns the factor in effect at elapsed time t (sec).

double Pattern::factorAt(double t) const
{
    if ( factors.size() == 0 ) return 1.0;
    if ( interval <= 0 ) return factors[0];
    int nPeriods = static_cast<int>((startTime + t) / interval);
    return factors[nPeriods % factors.size()];
}
