/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

 //! \file link.h
 //! \brief Describes the Link class.

#ifndef LINK_H_
#define LINK_H_

#include "Elements/element.h"

#include <string>

class Node;
class MemPool;

//! \class Link
//! \brief An edge between two nodes in a pipe network.
//!
//! One record holds all three link variants. A PIPE uses its length,
//! diameter and roughness; a PUMP either a head curve (curveA, curveB,
//! curveC, designFlow) or a fixed power; a VALVE (a pressure reducing valve)
//! its diameter and pressure setting.

class Link: public Element
{
  public:

    enum LinkType {PIPE, PUMP, VALVE};
    enum LinkStatus {LINK_CLOSED, LINK_OPEN, LINK_CV};
    enum PumpType {HEAD_PUMP, POWER_PUMP};

    Link(std::string name_, int type_);
    ~Link();

    static Link* factory(int type_, std::string name_, MemPool* memPool);
    static std::string typeStr(int type_);

    void   initialize();
    double getVelocity(double q) const;
    double valveResistance() const;

    int    type;              //!< PIPE, PUMP or VALVE
    Node*  fromNode;          //!< pointer to the link's start node
    Node*  toNode;            //!< pointer to the link's end node
    int    initStatus;        //!< base status (open, closed or check valve)

    // Pipe and valve data
    double length;            //!< pipe length (m)
    double diameter;          //!< pipe or valve diameter (m)
    double roughness;         //!< Hazen-Williams C-factor
    double setting;           //!< valve pressure setting (m)

    // Pump data
    int    pumpType;          //!< HEAD_PUMP or POWER_PUMP
    double curveA;            //!< shutoff head coefficient (m)
    double curveB;            //!< head curve coefficient
    double curveC;            //!< head curve exponent
    double designFlow;        //!< flow at the design point (m3/s)
    double power;             //!< fixed power (W)

    // Computed variables
    double resistance;        //!< head loss resistance coefficient
    double flow;              //!< flow rate (m3/s)
};

#endif
