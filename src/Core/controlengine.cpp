/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "controlengine.h"
#include "network.h"
#include "error.h"
#include "Elements/node.h"
#include "Elements/link.h"
#include "Elements/control.h"

#include <algorithm>
using namespace std;

static bool contains(const vector<Link*>& links, Link* link)
{
    return find(links.begin(), links.end(), link) != links.end();
}

static void removeLink(vector<Link*>& links, Link* link)
{
    links.erase(std::remove(links.begin(), links.end(), link), links.end());
}

//-----------------------------------------------------------------------------

ControlEngine::ControlEngine() : network(nullptr)
{}

void ControlEngine::open(Network* nw)
{
    network = nw;
    validate();
}

//-----------------------------------------------------------------------------

//  Checks that every conditional control is triggered by tank levels.

void ControlEngine::validate()
{
    for (ConditionalControl* control : network->conditionalControls())
    {
        const vector<ConditionalControl::Trigger>* lists[] = {
            &control->openAbove, &control->openBelow,
            &control->closedAbove, &control->closedBelow };
        for (const vector<ConditionalControl::Trigger>* triggers : lists)
        {
            for (const ConditionalControl::Trigger& trigger : *triggers)
            {
                if ( trigger.node->type != Node::TANK )
                {
                    throw NetworkError(NetworkError::ILLEGAL_CONTROL_NODE,
                                       control->link->name);
                }
            }
        }
    }
}

//-----------------------------------------------------------------------------

void ControlEngine::apply(const vector<double>& tankHead,
                          vector<Link*>& ctrlClosed,
                          vector<Link*>& schedClosed,
                          vector<Link*>& reopened)
{
    bool reportStatus = network->option(Options::REPORT_STATUS);

    for (ConditionalControl* control : network->conditionalControls())
    {
        Link* link = control->link;

        for (const ConditionalControl::Trigger& trigger : control->openBelow)
        {
            double level = tankHead[trigger.node->index] - trigger.node->elev;
            if ( level <= trigger.level &&
                 openLink(link, ctrlClosed, schedClosed, reopened) &&
                 reportStatus )
            {
                network->msgLog << "\n    " << Link::typeStr(link->type) << " "
                    << link->name << " opened by level of tank " << trigger.node->name;
            }
        }

        for (const ConditionalControl::Trigger& trigger : control->closedAbove)
        {
            double level = tankHead[trigger.node->index] - trigger.node->elev;
            if ( !contains(ctrlClosed, link) && level >= trigger.level )
            {
                ctrlClosed.push_back(link);
                if ( reportStatus ) network->msgLog << "\n    "
                    << Link::typeStr(link->type) << " " << link->name
                    << " closed by level of tank " << trigger.node->name;
            }
        }

        for (const ConditionalControl::Trigger& trigger : control->openAbove)
        {
            double level = tankHead[trigger.node->index] - trigger.node->elev;
            if ( level >= trigger.level &&
                 openLink(link, ctrlClosed, schedClosed, reopened) &&
                 reportStatus )
            {
                network->msgLog << "\n    " << Link::typeStr(link->type) << " "
                    << link->name << " opened by level of tank " << trigger.node->name;
            }
        }

        for (const ConditionalControl::Trigger& trigger : control->closedBelow)
        {
            double level = tankHead[trigger.node->index] - trigger.node->elev;
            if ( !contains(ctrlClosed, link) && level <= trigger.level )
            {
                ctrlClosed.push_back(link);
                if ( reportStatus ) network->msgLog << "\n    "
                    << Link::typeStr(link->type) << " " << link->name
                    << " closed by level of tank " << trigger.node->name;
            }
        }
    }
}

//-----------------------------------------------------------------------------

//  Opens a link closed by a control. A scheduled closure of the same link
//  is lifted too, for good if the link's base status is closed. Returns
//  false if no control had closed the link.

bool ControlEngine::openLink(Link* link, vector<Link*>& ctrlClosed,
                             vector<Link*>& schedClosed, vector<Link*>& reopened)
{
    if ( !contains(ctrlClosed, link) ) return false;
    removeLink(ctrlClosed, link);

    if ( contains(schedClosed, link) )
    {
        removeLink(schedClosed, link);
        if ( link->initStatus == Link::LINK_CLOSED && !contains(reopened, link) )
        {
            reopened.push_back(link);
        }
    }
    return true;
}
