/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

 //! \file network.h
 //! \brief Describes the Network class.

#ifndef NETWORK_H_
#define NETWORK_H_

#include "Core/options.h"
#include "Elements/element.h"

#include <vector>
#include <sstream>
#include <unordered_map>
#include <string>

class Node;
class Link;
class Pattern;
class Control;
class ConditionalControl;
class HeadLossModel;
class MemPool;

//! \class Network
//! \brief Contains the data elements that describe a pipe network.
//!
//! Besides holding the network's components, a Network answers the queries
//! the hydraulic engine makes of it: elements by name or index, the links
//! incident to a node, a link's scheduled status at a given time, and the
//! required demand at a junction over the simulation horizon. The engine
//! never modifies the network's input data.

class Network
{
  public:
    Network();
    ~Network();

    // Clears all elements from the network
    void clear();

    // Adds an element to the network
    bool addElement(Element::ElementType eType, int subType, std::string name);

    // Builds up a network one component at a time
    Node* addJunction(const std::string& name, double elev, double demand,
                      const std::string& patternName = "");
    Node* addTank(const std::string& name, double elev, double diam,
                  double minLvl, double maxLvl, double initLvl);
    Node* addReservoir(const std::string& name, double head);
    Link* addPipe(const std::string& name, const std::string& node1,
                  const std::string& node2, double len, double diam,
                  double roughness);
    Link* addHeadPump(const std::string& name, const std::string& node1,
                      const std::string& node2, double a, double b, double c,
                      double designFlow);
    Link* addPowerPump(const std::string& name, const std::string& node1,
                       const std::string& node2, double power);
    Link* addValve(const std::string& name, const std::string& node1,
                   const std::string& node2, double diam, double setting);
    Pattern* addPattern(const std::string& name, const std::vector<double>& factors);
    void  addTimeControl(const std::string& linkName, int time, int status);
    void  addConditionalControl(const std::string& linkName, int triggerType,
                                const std::string& nodeName, double level);

    // Finds element counts by type and index by ID name
    int count(Element::ElementType eType);
    int indexOf(Element::ElementType eType, const std::string& name);

    // Gets an analysis option by type
    int           option(Options::IndexOption type);
    double        option(Options::ValueOption type);
    int           option(Options::TimeOption type);
    std::string   option(Options::StringOption type);

    // Gets a network element by ID name
    Node*    node(const std::string& name);
    Link*    link(const std::string& name);
    Pattern* pattern(const std::string& name);

    // Gets a network element by index
    Node*    node(const int index);
    Link*    link(const int index);
    Pattern* pattern(const int index);

    // Queries made by the hydraulic engine
    int  hydPeriods();
    std::vector<Link*> getLinksConnectedToNode(Node* node);
    bool isLinkOpen(Link* link, int t);
    std::vector<double> demandSeries(Node* node);
    const std::vector<ConditionalControl*>& conditionalControls() { return condControls; }

    // Creates analysis models
    bool createHeadLossModel();

    // Computational sub-models
    HeadLossModel* headLossModel;

    // Elements of a network
    std::vector<Node*>    nodes;               //!< Collection of node objects
    std::vector<Link*>    links;               //!< Collection of link objects
    std::vector<Pattern*> patterns;            //!< Collection of time pattern objects
    std::vector<Control*> controls;            //!< Collection of time controls

    Options            options;                //!< Analysis options
    std::ostringstream msgLog;                 //!< Status message log

  private:
    MemPool* memPool;                          //!< Memory pool for network objects

    std::vector<ConditionalControl*> condControls;

    // Hash tables for element indexing
    std::unordered_map<std::string, Element*> nodeTable;
    std::unordered_map<std::string, Element*> linkTable;
    std::unordered_map<std::string, Element*> patternTable;

    Link* addLink(int type, const std::string& name, const std::string& node1,
                  const std::string& node2);
};

//-----------------------------------------------------------------------------
//    Inline Functions
//-----------------------------------------------------------------------------

inline int Network::option(Options::IndexOption type)
{
    return options.indexOption(type);
}

inline double Network::option(Options::ValueOption type)
{
    return options.valueOption(type);
}

inline int Network::option(Options::TimeOption type)
{
    return options.timeOption(type);
}

inline std::string Network::option(Options::StringOption type)
{
    return options.stringOption(type);
}

#endif // NETWORK_H_
