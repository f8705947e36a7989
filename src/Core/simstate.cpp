/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "simstate.h"
#include "network.h"
#include "valvestatus.h"
#include "Elements/node.h"
#include "Elements/link.h"

//-----------------------------------------------------------------------------

//  Sets the state a simulation starts from: tanks at their initial levels,
//  every valve ACTIVE and link status taken from the time controls.

void SimulationState::init(Network* nw)
{
    period = 0;
    firstTimestep = true;
    trials = 0;
    ctrlClosed.clear();

    int nNodes = nw->count(Element::NODE);
    lastTankHead.assign(nNodes, 0.0);
    for (Node* node : nw->nodes)
    {
        if ( node->type == Node::TANK )
        {
            lastTankHead[node->index] = node->elev + node->initLevel;
        }
    }

    int nLinks = nw->count(Element::LINK);
    int nPeriods = nw->hydPeriods();
    int hydStep = nw->option(Options::HYD_STEP);
    valveStatus.assign(nLinks, ValveStatus::ACTIVE);
    linkSchedule.assign(nLinks, std::vector<char>(nPeriods, 1));
    for (Link* link : nw->links)
    {
        for (int t = 0; t < nPeriods; t++)
        {
            linkSchedule[link->index][t] = nw->isLinkOpen(link, t * hydStep);
        }
    }
}

//-----------------------------------------------------------------------------

//  Schedules a link to be open from a given period to the end of the run.

void SimulationState::reopenLink(int link, int fromPeriod)
{
    std::vector<char>& schedule = linkSchedule[link];
    for (size_t t = fromPeriod; t < schedule.size(); t++) schedule[t] = 1;
}
