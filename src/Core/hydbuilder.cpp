/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

 ///////////////////////////////////////////////
 //  Implementation of the HydBuilder class.  //
 ///////////////////////////////////////////////

#include "hydbuilder.h"
#include "network.h"
#include "simstate.h"
#include "valvestatus.h"
#include "constants.h"
#include "error.h"
#include "Elements/node.h"
#include "Elements/link.h"
#include "Models/headlossmodel.h"
#include "Solvers/eqnsystem.h"

#include <limits>
using namespace std;

static const double INF = numeric_limits<double>::infinity();

//-----------------------------------------------------------------------------

HydBuilder::HydBuilder() :
    network(nullptr),
    tstep(0.0)
{}

HydBuilder::~HydBuilder() {}

//-----------------------------------------------------------------------------

//  Caches the network data that does not change during a run. Patterns must
//  be initialized before this is called.

void HydBuilder::open(Network* nw)
{
    network = nw;
    tstep = nw->option(Options::HYD_STEP);

    int nNodes = nw->count(Element::NODE);
    adjacency.assign(nNodes, vector<Link*>());
    demands.assign(nNodes, vector<double>());
    for (Node* node : nw->nodes)
    {
        adjacency[node->index] = nw->getLinksConnectedToNode(node);
        if ( node->type == Node::JUNCTION )
        {
            demands[node->index] = nw->demandSeries(node);
        }
    }
}

//-----------------------------------------------------------------------------

//  Rejects link types the equation system can't represent.

void HydBuilder::checkComponents()
{
    for (Link* link : network->links)
    {
        if ( link->initStatus == Link::LINK_CV )
        {
            throw InputError(InputError::CHECK_VALVE_NOT_SUPPORTED, link->name);
        }
        if ( link->type == Link::PUMP &&
             link->pumpType != Link::HEAD_PUMP &&
             link->pumpType != Link::POWER_PUMP )
        {
            throw InputError(InputError::INVALID_PUMP_CURVE, link->name);
        }
    }
}

//-----------------------------------------------------------------------------

double HydBuilder::requiredDemand(const Node* node, int period) const
{
    const vector<double>& series = demands[node->index];
    if ( period < 0 || period >= (int)series.size() ) return 0.0;
    return series[period];
}

//-----------------------------------------------------------------------------

//  Names a variable, e.g. "flow[P1]" or, inside a horizon system, "flow[P1,3]".

string HydBuilder::varName(const string& kind, const string& element, int period)
{
    if ( period < 0 ) return kind + "[" + element + "]";
    return kind + "[" + element + "," + to_string(period) + "]";
}

//-----------------------------------------------------------------------------

//  Builds the system for a single time period.

void HydBuilder::buildInstant(EquationSystem& sys, InstantIndex& idx, int period,
                              bool firstTimestep,
                              const vector<double>& lastTankHead,
                              const vector<char>& closed,
                              const vector<int>& valveStatus, bool headBounds)
{
    checkComponents();

    addVariables(sys, idx, period, -1);
    addLinkEquations(sys, idx, closed, -1);
    addMassBalances(sys, idx, -1);
    if ( !firstTimestep ) addTankUpdates(sys, idx, nullptr, lastTankHead, -1);
    fixBoundaryValues(sys, idx, firstTimestep, closed);
    addValveConstraints(sys, idx, closed, valveStatus, -1);
    seedPumpHeads(sys, idx, closed);
    if ( headBounds ) setHeadBounds(sys, idx);
}

//-----------------------------------------------------------------------------

//  Builds one system spanning every time period. Only scheduled closures
//  apply and valves keep the status found in the simulation state.

void HydBuilder::buildHorizon(EquationSystem& sys, vector<InstantIndex>& idx,
                              const SimulationState& state)
{
    checkComponents();

    int nPeriods = network->hydPeriods();
    int nLinks = network->count(Element::LINK);
    idx.assign(nPeriods, InstantIndex());
    vector<char> closed(nLinks, 0);

    for (int t = 0; t < nPeriods; t++)
    {
        for (int i = 0; i < nLinks; i++)
        {
            closed[i] = !state.isScheduledOpen(i, t);
        }
        addVariables(sys, idx[t], t, t);
        addLinkEquations(sys, idx[t], closed, t);
        addMassBalances(sys, idx[t], t);
        if ( t > 0 ) addTankUpdates(sys, idx[t], &idx[t-1], state.lastTankHead, t);
        fixBoundaryValues(sys, idx[t], t == 0, closed);
        addValveConstraints(sys, idx[t], closed, state.valveStatus, t);
        seedPumpHeads(sys, idx[t], closed);
        setHeadBounds(sys, idx[t]);
    }
}

//-----------------------------------------------------------------------------

void HydBuilder::addVariables(EquationSystem& sys, InstantIndex& idx,
                              int period, int tag)
{
    idx.flow.assign(network->count(Element::LINK), -1);
    idx.head.assign(network->count(Element::NODE), -1);
    idx.nodeFlow.assign(network->count(Element::NODE), -1);

    for (Link* link : network->links)
    {
        double q0 = INIT_FLOW;
        if ( link->type == Link::PUMP && link->pumpType == Link::HEAD_PUMP )
        {
            q0 = link->designFlow;
        }
        idx.flow[link->index] = sys.addVariable(varName("flow", link->name, tag), q0);
    }

    for (Node* node : network->nodes)
    {
        int i = node->index;
        switch ( node->type )
        {
        case Node::JUNCTION:
            idx.head[i] = sys.addVariable(varName("head", node->name, tag), node->elev);
            idx.nodeFlow[i] = sys.addVariable(varName("demand", node->name, tag), 0.0);
            sys.fix(idx.nodeFlow[i], requiredDemand(node, period));
            break;

        case Node::TANK:
            idx.head[i] = sys.addVariable(varName("head", node->name, tag), node->elev);
            idx.nodeFlow[i] = sys.addVariable(varName("inflow", node->name, tag),
                                              INIT_NODE_FLOW);
            break;

        case Node::RESERVOIR:
            idx.head[i] = sys.addVariable(varName("head", node->name, tag), INIT_HEAD);
            idx.nodeFlow[i] = sys.addVariable(varName("outflow", node->name, tag),
                                              INIT_NODE_FLOW);
            break;
        }
    }
}

//-----------------------------------------------------------------------------

//  Adds the head loss or head gain equation of each open pipe and pump.

void HydBuilder::addLinkEquations(EquationSystem& sys, const InstantIndex& idx,
                                  const vector<char>& closed, int tag)
{
    const HeadLossModel* model = network->headLossModel;
    for (Link* link : network->links)
    {
        if ( closed[link->index] ) continue;
        int q = idx.flow[link->index];
        int h1 = idx.head[link->fromNode->index];
        int h2 = idx.head[link->toNode->index];

        switch ( link->type )
        {
        case Link::PIPE:
            sys.addEquation(new PipeHeadLossEquation(
                varName("headloss", link->name, tag), q, h1, h2,
                link->resistance, model));
            break;

        case Link::PUMP:
            if ( link->pumpType == Link::HEAD_PUMP )
            {
                sys.addEquation(new PumpHeadEquation(
                    varName("pumphead", link->name, tag), q, h1, h2,
                    link->curveA, link->curveB, link->curveC));
            }
            else
            {
                sys.addEquation(new PumpPowerEquation(
                    varName("pumppower", link->name, tag), q, h1, h2,
                    link->power));
            }
            break;

        default:
            break;
        }
    }
}

//-----------------------------------------------------------------------------

//  Adds the constraint that goes with each open valve's current status.

void HydBuilder::addValveConstraints(EquationSystem& sys, const InstantIndex& idx,
                                     const vector<char>& closed,
                                     const vector<int>& valveStatus, int tag)
{
    for (Link* link : network->links)
    {
        if ( link->type != Link::VALVE || closed[link->index] ) continue;
        int q = idx.flow[link->index];
        int h1 = idx.head[link->fromNode->index];
        int h2 = idx.head[link->toNode->index];

        switch ( valveStatus[link->index] )
        {
        case ValveStatus::CLOSED:
            sys.fix(q, 0.0);
            break;

        case ValveStatus::OPEN:
            sys.addEquation(new ValveHeadLossEquation(
                varName("valve", link->name, tag), q, h1, h2,
                link->valveResistance()));
            break;

        case ValveStatus::ACTIVE:
            sys.fix(h2, link->setting + link->toNode->elev);
            break;
        }
    }
}

//-----------------------------------------------------------------------------

//  Adds a flow balance for each node: inflow - outflow = nodal flow.

void HydBuilder::addMassBalances(EquationSystem& sys, const InstantIndex& idx,
                                 int tag)
{
    for (Node* node : network->nodes)
    {
        LinearEquation* eqn = new LinearEquation(varName("balance", node->name, tag));
        sys.addEquation(eqn);
        for (Link* link : adjacency[node->index])
        {
            if ( link->toNode == node )
            {
                eqn->addTerm(idx.flow[link->index], 1.0);
            }
            else if ( link->fromNode == node )
            {
                eqn->addTerm(idx.flow[link->index], -1.0);
            }
            else
            {
                throw NetworkError(NetworkError::INCONSISTENT_TOPOLOGY, link->name);
            }
        }
        eqn->addTerm(idx.nodeFlow[node->index], -1.0);
    }
}

//-----------------------------------------------------------------------------

//  Relates each tank's head to its head in the previous period:
//  qin * dt * 4 / (pi * D^2) = h - hPrev.

void HydBuilder::addTankUpdates(EquationSystem& sys, const InstantIndex& idx,
                                const InstantIndex* prevIdx,
                                const vector<double>& lastTankHead, int tag)
{
    for (Node* node : network->nodes)
    {
        if ( node->type != Node::TANK ) continue;
        int i = node->index;
        double area = PI * node->diameter * node->diameter / 4.0;

        LinearEquation* eqn;
        if ( prevIdx )
        {
            eqn = new LinearEquation(varName("tank", node->name, tag), 0.0);
            eqn->addTerm(prevIdx->head[i], 1.0);
        }
        else
        {
            eqn = new LinearEquation(varName("tank", node->name, tag),
                                     -lastTankHead[i]);
        }
        eqn->addTerm(idx.nodeFlow[i], tstep / area);
        eqn->addTerm(idx.head[i], -1.0);
        sys.addEquation(eqn);
    }
}

//-----------------------------------------------------------------------------

//  Fixes reservoir heads, initial tank heads and the flow in closed links.

void HydBuilder::fixBoundaryValues(EquationSystem& sys, const InstantIndex& idx,
                                   bool pinTanks, const vector<char>& closed)
{
    for (Node* node : network->nodes)
    {
        if ( node->type == Node::RESERVOIR )
        {
            sys.fix(idx.head[node->index], node->baseHead);
        }
        else if ( node->type == Node::TANK && pinTanks )
        {
            sys.fix(idx.head[node->index], node->elev + node->initLevel);
        }
    }

    for (Link* link : network->links)
    {
        if ( closed[link->index] ) sys.fix(idx.flow[link->index], 0.0);
    }
}

//-----------------------------------------------------------------------------

//  Raises the starting head at the discharge of each open power pump so the
//  pump starts out adding head at its initial flow.

void HydBuilder::seedPumpHeads(EquationSystem& sys, const InstantIndex& idx,
                               const vector<char>& closed)
{
    for (Link* link : network->links)
    {
        if ( link->type != Link::PUMP || link->pumpType != Link::POWER_PUMP ) continue;
        if ( closed[link->index] ) continue;
        int h2 = idx.head[link->toNode->index];
        if ( sys.variable(h2).fixed ) continue;
        double h1 = sys.value(idx.head[link->fromNode->index]);
        double q = sys.value(idx.flow[link->index]);
        sys.setValue(h2, h1 + link->power / (GRAVITY * WATER_DENSITY * q));
    }
}

//-----------------------------------------------------------------------------

//  Sets junction head floors, tank head limits and the no-reverse-flow limit
//  on pumps.

void HydBuilder::setHeadBounds(EquationSystem& sys, const InstantIndex& idx)
{
    for (Node* node : network->nodes)
    {
        if ( node->type == Node::RESERVOIR ) continue;
        sys.setBounds(idx.head[node->index], node->minHead(), node->maxHead());
    }
    for (Link* link : network->links)
    {
        if ( link->type == Link::PUMP )
        {
            sys.setBounds(idx.flow[link->index], 0.0, INF);
        }
    }
}
