/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file control.h
//! \brief Describes the Control and ConditionalControl classes.

#ifndef CONTROL_H_
#define CONTROL_H_

#include "Elements/element.h"

#include <string>
#include <vector>

class Link;
class Node;
class MemPool;

//! \class Control
//! \brief A scheduled change of a link's open/closed status.
//!
//! A link's status at elapsed time t is set by the latest of its controls
//! whose time is no later than t. Before its first control the link has
//! its base status.

class Control: public Element
{
  public:

    Control(std::string name_);
    ~Control();

    static Control* factory(std::string name_, MemPool* memPool);

    Link*  link;      //!< link being controlled
    int    status;    //!< Link::LINK_OPEN or Link::LINK_CLOSED
    int    time;      //!< elapsed time when the control takes effect (sec)
};

//! \class ConditionalControl
//! \brief Tank level triggers that override a link's scheduled status.

class ConditionalControl
{
  public:

    enum TriggerType {OPEN_ABOVE, OPEN_BELOW, CLOSED_ABOVE, CLOSED_BELOW};

    struct Trigger
    {
        Node*  node;     //!< tank whose level is monitored
        double level;    //!< threshold water level (m)
    };

    ConditionalControl(Link* link_) : link(link_) {}

    void addTrigger(int type, Node* node, double level);
    int  triggerCount() const;


    Link*                link;
    std::vector<Trigger> openAbove;
    std::vector<Trigger> openBelow;
    std::vector<Trigger> closedAbove;
    std::vector<Trigger> closedBelow;
};

#endif
