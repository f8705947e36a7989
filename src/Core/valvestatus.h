/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file valvestatus.h
//! \brief Describes the ValveStatus class.

#ifndef VALVESTATUS_H_
#define VALVESTATUS_H_

#include <string>

class Link;

//! \class ValveStatus
//! \brief Operating state logic of a pressure reducing valve.
//!
//! A PRV is either fully OPEN, CLOSED, or ACTIVE (regulating its downstream
//! pressure). After each solution of the network the engine asks for the
//! valve's next status; a change means the time period must be re-solved.

class ValveStatus
{
  public:

    enum Status {OPEN, ACTIVE, CLOSED};

    /// Returns the status a PRV should take given its current status, its
    /// flow q, upstream head h1, downstream head h2 and the head hSet that
    /// corresponds to its pressure setting.
    static int prvStatus(int status, double q, double h1, double h2,
                         double hSet, double qTol, double hTol);

    static std::string statusStr(int status);

    static std::string writeStatusChange(const Link* valve, int oldStatus,
                                         int newStatus);
};

#endif
