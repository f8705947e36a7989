/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "node.h"
#include "Core/constants.h"
#include "Utilities/mempool.h"

#include <limits>
#include <new>
using namespace std;

static const string nodeTypeWords[] = {"Junction", "Tank", "Reservoir"};

//-----------------------------------------------------------------------------

// Constructor

Node::Node(string name_, int type_) :
    Element(name_),
    type(type_),
    elev(0.0),
    diameter(0.0),
    minLevel(0.0),
    maxLevel(0.0),
    initLevel(0.0),
    baseHead(0.0),
    head(0.0),
    fullDemand(0.0),
    actualDemand(0.0),
    outflow(0.0)
{}

// Destructor

Node::~Node() {}

//-----------------------------------------------------------------------------

// Factory Method

Node* Node::factory(int type_, string name_, MemPool* memPool)
{
    switch ( type_ )
    {
    case JUNCTION:
    case TANK:
    case RESERVOIR:
        return new(memPool->alloc(sizeof(Node))) Node(name_, type_);
    default:
        return nullptr;
    }
}

//-----------------------------------------------------------------------------

string Node::typeStr(int type_)
{
    if ( type_ < JUNCTION || type_ > RESERVOIR ) return "";
    return nodeTypeWords[type_];
}

//-----------------------------------------------------------------------------

//  Sets a node's computed variables to their values at the start of a run.

void Node::initialize()
{
    switch ( type )
    {
    case JUNCTION:
        head = elev;
        break;
    case TANK:
        head = elev + initLevel;
        break;
    case RESERVOIR:
        head = baseHead;
        break;
    }
    fullDemand = 0.0;
    actualDemand = 0.0;
    outflow = 0.0;
}

//-----------------------------------------------------------------------------

//  Finds a junction's required demand at elapsed time t (sec).

double Node::findFullDemand(double multiplier, double t) const
{
    if ( type != JUNCTION ) return 0.0;
    return primaryDemand.getFullDemand(multiplier, t);
}

//-----------------------------------------------------------------------------

double Node::minHead() const
{
    switch ( type )
    {
    case JUNCTION:  return elev;
    case TANK:      return elev + minLevel;
    default:        return -numeric_limits<double>::infinity();
    }
}

double Node::maxHead() const
{
    if ( type == TANK ) return elev + maxLevel;
    return numeric_limits<double>::infinity();
}
