/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file hydresults.h
//! \brief Describes the HydResults class.

#ifndef HYDRESULTS_H_
#define HYDRESULTS_H_

#include <string>
#include <vector>
#include <unordered_map>

class Network;

//! \struct NodeResult
//! \brief Hydraulic results for a node at one time instant.

struct NodeResult
{
    std::string name;
    std::string type;      // Junction, Tank or Reservoir
    int    time;           // elapsed time (sec)
    double head;           // hydraulic head (m)
    double pressure;       // head - elevation (m), 0 for reservoirs
    double demand;         // actual demand, tank inflow or reservoir outflow (m3/s)

    NodeResult() : time(0), head(0), pressure(0), demand(0) {}
};

//! \struct LinkResult
//! \brief Hydraulic results for a link at one time instant.

struct LinkResult
{
    std::string name;
    std::string type;      // Pipe, Pump or Valve
    int    time;           // elapsed time (sec)
    double flow;           // flow rate (m3/s)
    double velocity;       // flow velocity (m/s), 0 for pumps and valves

    LinkResult() : time(0), flow(0), velocity(0) {}
};

//! \class HydResults
//! \brief Accumulates the solved state of a network at each time instant.
//!
//! Records are kept in memory, one row of node results and one row of link
//! results per recorded instant, in the network's element order.

class HydResults
{
  public:
    HydResults();

    void clear();

    /// Stores the node and link values currently held by the network.
    void record(Network* nw, int time);

    int  periodCount() const { return (int)times.size(); }
    int  timeOf(int period) const { return times[period]; }

    const std::vector<NodeResult>& nodeResults(int period) const;
    const std::vector<LinkResult>& linkResults(int period) const;

    const NodeResult* node(const std::string& name, int period) const;
    const LinkResult* link(const std::string& name, int period) const;

    // Series of one value over all recorded periods
    std::vector<double> headSeries(const std::string& nodeName) const;
    std::vector<double> flowSeries(const std::string& linkName) const;

  private:
    std::vector<int> times;
    std::vector<std::vector<NodeResult>> nodeRows;
    std::vector<std::vector<LinkResult>> linkRows;
    std::unordered_map<std::string, int> nodeColumn;
    std::unordered_map<std::string, int> linkColumn;
};

#endif
