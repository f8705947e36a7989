/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

 ////////////////////////////////////////////
 //  Implementation of the Network class.  //
 ////////////////////////////////////////////

#include "network.h"
#include "error.h"
#include "Elements/node.h"
#include "Elements/link.h"
#include "Elements/pattern.h"
#include "Elements/control.h"
#include "Models/headlossmodel.h"
#include "Utilities/mempool.h"

#include <cmath>
using namespace std;

//-----------------------------------------------------------------------------

//  Constructor

Network::Network() :
    headLossModel(nullptr),
    memPool(nullptr)
{
    memPool = new MemPool();
    options.setDefaults();
}

//  Destructor

Network::~Network()
{
    clear();
    delete memPool;
}

//-----------------------------------------------------------------------------

//  Removes all elements from the network.

void Network::clear()
{
    // ... elements live in the memory pool so only their destructors are called
    for (Node* node : nodes) node->~Node();
    nodes.clear();

    for (Link* link : links) link->~Link();
    links.clear();

    for (Pattern* pattern : patterns) pattern->~Pattern();
    patterns.clear();

    for (Control* control : controls) control->~Control();
    controls.clear();

    for (ConditionalControl* control : condControls) delete control;
    condControls.clear();

    nodeTable.clear();
    linkTable.clear();
    patternTable.clear();
    memPool->reset();

    delete headLossModel;
    headLossModel = nullptr;

    options.setDefaults();
    msgLog.str("");
}

//-----------------------------------------------------------------------------

//  Adds a new element to the network. Returns false if an element of the
//  same kind with the same name already exists.

bool Network::addElement(Element::ElementType eType, int subType, string name)
{
    switch (eType)
    {
    case Element::NODE:
    {
        if ( nodeTable.find(name) != nodeTable.end() ) return false;
        Node* node = Node::factory(subType, name, memPool);
        if ( node == nullptr ) return false;
        node->index = static_cast<int>(nodes.size());
        nodes.push_back(node);
        nodeTable[name] = node;
        return true;
    }

    case Element::LINK:
    {
        if ( linkTable.find(name) != linkTable.end() ) return false;
        Link* link = Link::factory(subType, name, memPool);
        if ( link == nullptr ) return false;
        link->index = static_cast<int>(links.size());
        links.push_back(link);
        linkTable[name] = link;
        return true;
    }

    case Element::PATTERN:
    {
        if ( patternTable.find(name) != patternTable.end() ) return false;
        Pattern* pattern = Pattern::factory(name, memPool);
        pattern->index = static_cast<int>(patterns.size());
        patterns.push_back(pattern);
        patternTable[name] = pattern;
        return true;
    }

    case Element::CONTROL:
    {
        Control* control = Control::factory(name, memPool);
        control->index = static_cast<int>(controls.size());
        controls.push_back(control);
        return true;
    }
    }
    return false;
}

//-----------------------------------------------------------------------------

Node* Network::addJunction(const string& name, double elev, double demand,
                           const string& patternName)
{
    Pattern* demandPattern = nullptr;
    if ( patternName.size() > 0 )
    {
        demandPattern = pattern(patternName);
        if ( demandPattern == nullptr )
        {
            throw InputError(InputError::UNDEFINED_OBJECT, patternName);
        }
    }
    if ( !addElement(Element::NODE, Node::JUNCTION, name) )
    {
        throw InputError(InputError::DUPLICATE_ID, name);
    }
    Node* junc = nodes.back();
    junc->elev = elev;
    junc->primaryDemand.baseDemand = demand;
    junc->primaryDemand.timePattern = demandPattern;
    return junc;
}

Node* Network::addTank(const string& name, double elev, double diam,
                       double minLvl, double maxLvl, double initLvl)
{
    if ( diam <= 0.0 || minLvl > maxLvl || initLvl < minLvl || initLvl > maxLvl )
    {
        throw InputError(InputError::ILLEGAL_VALUE, name);
    }
    if ( !addElement(Element::NODE, Node::TANK, name) )
    {
        throw InputError(InputError::DUPLICATE_ID, name);
    }
    Node* tank = nodes.back();
    tank->elev = elev;
    tank->diameter = diam;
    tank->minLevel = minLvl;
    tank->maxLevel = maxLvl;
    tank->initLevel = initLvl;
    return tank;
}

Node* Network::addReservoir(const string& name, double head)
{
    if ( !addElement(Element::NODE, Node::RESERVOIR, name) )
    {
        throw InputError(InputError::DUPLICATE_ID, name);
    }
    Node* reservoir = nodes.back();
    reservoir->baseHead = head;
    reservoir->elev = head;
    return reservoir;
}

//-----------------------------------------------------------------------------

Link* Network::addLink(int type, const string& name, const string& node1,
                       const string& node2)
{
    Node* n1 = node(node1);
    Node* n2 = node(node2);
    if ( n1 == nullptr || n2 == nullptr )
    {
        throw NetworkError(NetworkError::UNCONNECTED_LINK, name);
    }
    if ( n1 == n2 )
    {
        throw NetworkError(NetworkError::SAME_END_NODES, name);
    }
    if ( !addElement(Element::LINK, type, name) )
    {
        throw InputError(InputError::DUPLICATE_ID, name);
    }
    Link* link = links.back();
    link->fromNode = n1;
    link->toNode = n2;
    return link;
}

Link* Network::addPipe(const string& name, const string& node1,
                       const string& node2, double len, double diam,
                       double roughness)
{
    if ( len <= 0.0 || diam <= 0.0 || roughness <= 0.0 )
    {
        throw InputError(InputError::ILLEGAL_VALUE, name);
    }
    Link* pipe = addLink(Link::PIPE, name, node1, node2);
    pipe->length = len;
    pipe->diameter = diam;
    pipe->roughness = roughness;
    return pipe;
}

Link* Network::addHeadPump(const string& name, const string& node1,
                           const string& node2, double a, double b, double c,
                           double designFlow)
{
    Link* pump = addLink(Link::PUMP, name, node1, node2);
    pump->pumpType = Link::HEAD_PUMP;
    pump->curveA = a;
    pump->curveB = b;
    pump->curveC = c;
    pump->designFlow = designFlow;
    return pump;
}

Link* Network::addPowerPump(const string& name, const string& node1,
                            const string& node2, double power)
{
    if ( power <= 0.0 ) throw InputError(InputError::ILLEGAL_VALUE, name);
    Link* pump = addLink(Link::PUMP, name, node1, node2);
    pump->pumpType = Link::POWER_PUMP;
    pump->power = power;
    return pump;
}

Link* Network::addValve(const string& name, const string& node1,
                        const string& node2, double diam, double setting)
{
    if ( diam <= 0.0 ) throw InputError(InputError::ILLEGAL_VALUE, name);
    Link* valve = addLink(Link::VALVE, name, node1, node2);
    valve->diameter = diam;
    valve->setting = setting;
    return valve;
}

//-----------------------------------------------------------------------------

Pattern* Network::addPattern(const string& name, const vector<double>& factors)
{
    if ( !addElement(Element::PATTERN, 0, name) )
    {
        throw InputError(InputError::DUPLICATE_ID, name);
    }
    Pattern* p = patterns.back();
    for (double f : factors) p->addFactor(f);
    return p;
}

//-----------------------------------------------------------------------------

//  Adds a control that sets a link's status at a given elapsed time (sec).

void Network::addTimeControl(const string& linkName, int time, int status)
{
    Link* controlLink = link(linkName);
    if ( controlLink == nullptr )
    {
        throw InputError(InputError::UNDEFINED_OBJECT, linkName);
    }
    if ( status != Link::LINK_OPEN && status != Link::LINK_CLOSED )
    {
        throw InputError(InputError::ILLEGAL_VALUE, linkName);
    }
    if ( time < 0 ) throw InputError(InputError::INVALID_TIME, linkName);

    addElement(Element::CONTROL, 0, linkName);
    Control* control = controls.back();
    control->link = controlLink;
    control->time = time;
    control->status = status;
}

//-----------------------------------------------------------------------------

//  Adds a tank level trigger to a link's conditional control.

void Network::addConditionalControl(const string& linkName, int triggerType,
                                    const string& nodeName, double level)
{
    Link* controlLink = link(linkName);
    if ( controlLink == nullptr )
    {
        throw InputError(InputError::UNDEFINED_OBJECT, linkName);
    }
    Node* triggerNode = node(nodeName);
    if ( triggerNode == nullptr )
    {
        throw InputError(InputError::UNDEFINED_OBJECT, nodeName);
    }
    if ( triggerType < ConditionalControl::OPEN_ABOVE ||
         triggerType > ConditionalControl::CLOSED_BELOW )
    {
        throw InputError(InputError::ILLEGAL_VALUE, linkName);
    }

    ConditionalControl* control = nullptr;
    for (ConditionalControl* c : condControls)
    {
        if ( c->link == controlLink )
        {
            control = c;
            break;
        }
    }
    if ( control == nullptr )
    {
        control = new ConditionalControl(controlLink);
        condControls.push_back(control);
    }
    control->addTrigger(triggerType, triggerNode, level);
}

//-----------------------------------------------------------------------------

//  Finds element counts by type.

int Network::count(Element::ElementType eType)
{
    switch(eType)
    {
    case Element::NODE:    return static_cast<int>(nodes.size());
    case Element::LINK:    return static_cast<int>(links.size());
    case Element::PATTERN: return static_cast<int>(patterns.size());
    case Element::CONTROL: return static_cast<int>(controls.size());
    }
    return 0;
}

//-----------------------------------------------------------------------------

//  Finds the index of an element given its name (-1 if not found).

int Network::indexOf(Element::ElementType eType, const string& name)
{
    unordered_map<string, Element*>* table = nullptr;
    switch(eType)
    {
    case Element::NODE:    table = &nodeTable;    break;
    case Element::LINK:    table = &linkTable;    break;
    case Element::PATTERN: table = &patternTable; break;
    default: return -1;
    }
    auto it = table->find(name);
    if ( it == table->end() ) return -1;
    return it->second->index;
}

//-----------------------------------------------------------------------------

//  Gets a network element by name.

Node* Network::node(const string& name)
{
    auto it = nodeTable.find(name);
    if ( it == nodeTable.end() ) return nullptr;
    return static_cast<Node*>(it->second);
}

Link* Network::link(const string& name)
{
    auto it = linkTable.find(name);
    if ( it == linkTable.end() ) return nullptr;
    return static_cast<Link*>(it->second);
}

Pattern* Network::pattern(const string& name)
{
    auto it = patternTable.find(name);
    if ( it == patternTable.end() ) return nullptr;
    return static_cast<Pattern*>(it->second);
}

//-----------------------------------------------------------------------------

//  Gets a network element by index.

Node* Network::node(const int index)
{
    return nodes[index];
}

Link* Network::link(const int index)
{
    return links[index];
}

Pattern* Network::pattern(const int index)
{
    return patterns[index];
}

//-----------------------------------------------------------------------------

//  Number of hydraulic time periods (instants) in the simulation,
//  counting both the starting and the final instant.

int Network::hydPeriods()
{
    int hydStep = option(Options::HYD_STEP);
    if ( hydStep <= 0 ) return 1;
    double duration = option(Options::TOTAL_DURATION);
    return static_cast<int>(floor(duration / hydStep + 0.5)) + 1;
}

//-----------------------------------------------------------------------------

//  Finds all links that have a given node as an end point.

vector<Link*> Network::getLinksConnectedToNode(Node* node)
{
    vector<Link*> connectedLinks;
    for (Link* link : links)
    {
        if ( link->fromNode == node || link->toNode == node )
        {
            connectedLinks.push_back(link);
        }
    }
    return connectedLinks;
}

//-----------------------------------------------------------------------------

//  Determines if a link is scheduled to be open at elapsed time t (sec).

bool Network::isLinkOpen(Link* link, int t)
{
    int status = link->initStatus;
    int latest = -1;
    for (Control* control : controls)
    {
        if ( control->link != link ) continue;
        if ( control->time <= t && control->time >= latest )
        {
            latest = control->time;
            status = control->status;
        }
    }
    return status != Link::LINK_CLOSED;
}

//-----------------------------------------------------------------------------

//  Returns a node's required demand at each hydraulic time period.

vector<double> Network::demandSeries(Node* node)
{
    int nPeriods = hydPeriods();
    int hydStep = option(Options::HYD_STEP);
    double multiplier = option(Options::DEMAND_MULTIPLIER);
    vector<double> series(nPeriods, 0.0);
    for (int t = 0; t < nPeriods; t++)
    {
        series[t] = node->findFullDemand(multiplier, (double)t * hydStep);
    }
    return series;
}

//-----------------------------------------------------------------------------

//  Creates the network's head loss model.

bool Network::createHeadLossModel()
{
    delete headLossModel;
    headLossModel = HeadLossModel::factory(option(Options::HEADLOSS_MODEL));
    return headLossModel != nullptr;
}
