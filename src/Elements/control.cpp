/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "control.h"
#include "link.h"
#include "Utilities/mempool.h"

#include <new>
using namespace std;

//-----------------------------------------------------------------------------

Control::Control(string name_) :
    Element(name_),
    link(nullptr),
    status(Link::LINK_OPEN),
    time(0)
{}

Control::~Control() {}

Control* Control::factory(string name_, MemPool* memPool)
{
    return new(memPool->alloc(sizeof(Control))) Control(name_);
}

//-----------------------------------------------------------------------------

void ConditionalControl::addTrigger(int type, Node* node, double level)
{
    Trigger trigger = {node, level};
    switch (type)
    {
    case OPEN_ABOVE:   openAbove.push_back(trigger);   break;
    case OPEN_BELOW:   openBelow.push_back(trigger);   break;
    case CLOSED_ABOVE: closedAbove.push_back(trigger); break;
    case CLOSED_BELOW: closedBelow.push_back(trigger); break;
    }
}

int ConditionalControl::triggerCount() const
{
    return static_cast<int>(openAbove.size() + openBelow.size() +
                            closedAbove.size() + closedBelow.size());
}
