/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Distributed under the MIT License (see the LICENSE file for details).
 *
 */

 //! \file node.h
 //! \brief Describes the Node class.

#ifndef NODE_H_
#define NODE_H_

#include "Elements/element.h"
#include "Elements/demand.h"

#include <string>

class MemPool;

//! \class Node
//! \brief A connection point between links in a network.
//!
//! A Node is a single record for all three node variants. Its type field
//! says which variant it is and which of the data members are meaningful:
//! - a JUNCTION uses elev and primaryDemand,
//! - a TANK uses elev, diameter and its min/max/init levels,
//! - a RESERVOIR uses baseHead.
//! Code that treats the variants differently switches on type.

class Node: public Element
{
  public:

    enum NodeType {JUNCTION, TANK, RESERVOIR};

    Node(std::string name_, int type_);
    ~Node();

    static Node* factory(int type_, std::string name_, MemPool* memPool);
    static std::string typeStr(int type_);

    void   initialize();
    double findFullDemand(double multiplier, double t) const;

    // Head limits implied by elevation (junction floor, tank min/max)
    double minHead() const;
    double maxHead() const;

    int    type;             //!< JUNCTION, TANK or RESERVOIR

    // Input parameters
    double elev;             //!< elevation (m)
    Demand primaryDemand;    //!< junction demand (m3/s)
    double diameter;         //!< tank diameter (m)
    double minLevel;         //!< tank minimum water level (m)
    double maxLevel;         //!< tank maximum water level (m)
    double initLevel;        //!< tank initial water level (m)
    double baseHead;         //!< reservoir fixed head (m)

    // Computed variables
    double head;             //!< hydraulic head (m)
    double fullDemand;       //!< required demand (m3/s)
    double actualDemand;     //!< delivered demand (m3/s)
    double outflow;          //!< tank net inflow or reservoir outflow (m3/s)
};

#endif
