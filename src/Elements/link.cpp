/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "link.h"
#include "Core/constants.h"
#include "Utilities/mempool.h"

#include <cmath>
#include <new>
using namespace std;

static const string linkTypeWords[] = {"Pipe", "Pump", "Valve"};

//-----------------------------------------------------------------------------

/// Constructor

Link::Link(string name_, int type_) :
    Element(name_),
    type(type_),
    fromNode(nullptr),
    toNode(nullptr),
    initStatus(LINK_OPEN),
    length(0.0),
    diameter(0.0),
    roughness(0.0),
    setting(0.0),
    pumpType(HEAD_PUMP),
    curveA(0.0),
    curveB(0.0),
    curveC(1.0),
    designFlow(0.0),
    power(0.0),
    resistance(0.0),
    flow(0.0)
{}

/// Destructor

Link::~Link() {}

//-----------------------------------------------------------------------------

/// Factory Method

Link* Link::factory(int type_, string name_, MemPool* memPool)
{
    switch ( type_ )
    {
    case PIPE:
    case PUMP:
    case VALVE:
        return new(memPool->alloc(sizeof(Link))) Link(name_, type_);
    default:
        return nullptr;
    }
}

//-----------------------------------------------------------------------------

string Link::typeStr(int type_)
{
    if ( type_ < PIPE || type_ > VALVE ) return "";
    return linkTypeWords[type_];
}

//-----------------------------------------------------------------------------

void Link::initialize()
{
    resistance = 0.0;
    flow = 0.0;
}

//-----------------------------------------------------------------------------

//  Returns the flow velocity (m/s) in a pipe; zero for pumps and valves.

double Link::getVelocity(double q) const
{
    if ( type != PIPE || diameter <= 0.0 ) return 0.0;
    return 4.0 * abs(q) / (PI * diameter * diameter);
}

//-----------------------------------------------------------------------------

//  Returns the loss coefficient of a fully opened valve.

double Link::valveResistance() const
{
    return 0.02 * DW_COEFF * (2.0 * diameter) / pow(diameter, 5.0);
}
