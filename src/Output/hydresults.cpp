/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "hydresults.h"
#include "Core/network.h"
#include "Elements/node.h"
#include "Elements/link.h"

using namespace std;

//-----------------------------------------------------------------------------

HydResults::HydResults() {}

void HydResults::clear()
{
    times.clear();
    nodeRows.clear();
    linkRows.clear();
    nodeColumn.clear();
    linkColumn.clear();
}

//-----------------------------------------------------------------------------

void HydResults::record(Network* nw, int time)
{
    if ( times.empty() )
    {
        for (Node* node : nw->nodes) nodeColumn[node->name] = node->index;
        for (Link* link : nw->links) linkColumn[link->name] = link->index;
    }
    times.push_back(time);

    vector<NodeResult> nodeRow(nw->nodes.size());
    for (Node* node : nw->nodes)
    {
        NodeResult& r = nodeRow[node->index];
        r.name = node->name;
        r.type = Node::typeStr(node->type);
        r.time = time;
        r.head = node->head;
        switch ( node->type )
        {
        case Node::JUNCTION:
            r.pressure = node->head - node->elev;
            r.demand = node->actualDemand;
            break;
        case Node::TANK:
            r.pressure = node->head - node->elev;
            r.demand = node->outflow;
            break;
        case Node::RESERVOIR:
            r.pressure = 0.0;
            r.demand = node->outflow;
            break;
        }
    }
    nodeRows.push_back(nodeRow);

    vector<LinkResult> linkRow(nw->links.size());
    for (Link* link : nw->links)
    {
        LinkResult& r = linkRow[link->index];
        r.name = link->name;
        r.type = Link::typeStr(link->type);
        r.time = time;
        r.flow = link->flow;
        r.velocity = link->getVelocity(link->flow);
    }
    linkRows.push_back(linkRow);
}

//-----------------------------------------------------------------------------

const vector<NodeResult>& HydResults::nodeResults(int period) const
{
    return nodeRows.at(period);
}

const vector<LinkResult>& HydResults::linkResults(int period) const
{
    return linkRows.at(period);
}

//-----------------------------------------------------------------------------

//  Returns nullptr if there is no such node or period.

const NodeResult* HydResults::node(const string& name, int period) const
{
    auto it = nodeColumn.find(name);
    if ( it == nodeColumn.end() ) return nullptr;
    if ( period < 0 || period >= periodCount() ) return nullptr;
    return &nodeRows[period][it->second];
}

const LinkResult* HydResults::link(const string& name, int period) const
{
    auto it = linkColumn.find(name);
    if ( it == linkColumn.end() ) return nullptr;
    if ( period < 0 || period >= periodCount() ) return nullptr;
    return &linkRows[period][it->second];
}

//-----------------------------------------------------------------------------

vector<double> HydResults::headSeries(const string& nodeName) const
{
    vector<double> series;
    auto it = nodeColumn.find(nodeName);
    if ( it == nodeColumn.end() ) return series;
    for (const vector<NodeResult>& row : nodeRows) series.push_back(row[it->second].head);
    return series;
}

vector<double> HydResults::flowSeries(const string& linkName) const
{
    vector<double> series;
    auto it = linkColumn.find(linkName);
    if ( it == linkColumn.end() ) return series;
    for (const vector<LinkResult>& row : linkRows) series.push_back(row[it->second].flow);
    return series;
}
