/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file simstate.h
//! \brief Describes the SimulationState struct.

#ifndef SIMSTATE_H_
#define SIMSTATE_H_

#include <vector>

class Network;
class Link;

//! \struct SimulationState
//! \brief Operating conditions carried from one time period to the next.
//!
//! The state is created when a simulation starts and is owned by the
//! hydraulic engine. The control engine and the valve status logic only
//! propose changes; the engine applies them here.

struct SimulationState
{
    int    period;                             //!< current time period
    bool   firstTimestep;                      //!< true until period 0 is solved
    int    trials;                             //!< re-solves of the current period
    std::vector<double> lastTankHead;          //!< last solved head, by node index
    std::vector<int>    valveStatus;           //!< ValveStatus, by link index
    std::vector<std::vector<char>> linkSchedule; //!< scheduled open status,
                                               //!< by link index and period
    std::vector<Link*>  ctrlClosed;            //!< links closed by controls

    void init(Network* nw);
    bool isScheduledOpen(int link, int t) const { return linkSchedule[link][t] != 0; }
    void reopenLink(int link, int fromPeriod);
};

#endif
