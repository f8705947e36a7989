/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file hydbuilder.h
//! \brief Describes the HydBuilder class.

#ifndef HYDBUILDER_H_
#define HYDBUILDER_H_

#include <string>
#include <vector>

class Network;
class Node;
class Link;
class EquationSystem;
struct SimulationState;

//! \struct InstantIndex
//! \brief Positions of one time instant's variables in an equation system.

struct InstantIndex
{
    std::vector<int> flow;       //!< flow variable, by link index
    std::vector<int> head;       //!< head variable, by node index
    std::vector<int> nodeFlow;   //!< demand, tank inflow or reservoir outflow,
                                 //!< by node index
};

//! \class HydBuilder
//! \brief Assembles the equation system that describes a network's hydraulics.
//!
//! For a single time instant the builder creates a flow variable for each
//! link, a head variable for each node and a nodal flow variable (junction
//! demand, tank net inflow or reservoir outflow) for each node. It then adds
//! a characteristic equation for every open pipe and pump, a mass balance for
//! every node, the valve constraints that go with each valve's status and
//! the tank level update from the previous instant. Reservoir heads, junction
//! demands and the flows in closed links are fixed values.
//!
//! The full horizon system strings one such instant per time period together,
//! linked only through the tank level updates.

class HydBuilder
{
  public:
    HydBuilder();
    ~HydBuilder();

    void open(Network* nw);
    void checkComponents();

    void buildInstant(EquationSystem& sys, InstantIndex& idx, int period,
                      bool firstTimestep,
                      const std::vector<double>& lastTankHead,
                      const std::vector<char>& closed,
                      const std::vector<int>& valveStatus, bool headBounds);

    void buildHorizon(EquationSystem& sys, std::vector<InstantIndex>& idx,
                      const SimulationState& state);

    double requiredDemand(const Node* node, int period) const;

    static std::string varName(const std::string& kind,
                               const std::string& element, int period);

  private:
    Network* network;
    double   tstep;                               //!< hydraulic time step (s)
    std::vector<std::vector<Link*>>  adjacency;   //!< links incident to each node
    std::vector<std::vector<double>> demands;     //!< required demand by node
                                                  //!< and period

    void addVariables(EquationSystem& sys, InstantIndex& idx, int period, int tag);
    void addLinkEquations(EquationSystem& sys, const InstantIndex& idx,
                          const std::vector<char>& closed, int tag);
    void addValveConstraints(EquationSystem& sys, const InstantIndex& idx,
                             const std::vector<char>& closed,
                             const std::vector<int>& valveStatus, int tag);
    void addMassBalances(EquationSystem& sys, const InstantIndex& idx, int tag);
    void addTankUpdates(EquationSystem& sys, const InstantIndex& idx,
                        const InstantIndex* prevIdx,
                        const std::vector<double>& lastTankHead, int tag);
    void fixBoundaryValues(EquationSystem& sys, const InstantIndex& idx,
                           bool pinTanks, const std::vector<char>& closed);
    void setHeadBounds(EquationSystem& sys, const InstantIndex& idx);
    void seedPumpHeads(EquationSystem& sys, const InstantIndex& idx,
                       const std::vector<char>& closed);
};

#endif
