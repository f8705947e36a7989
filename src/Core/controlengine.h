/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file controlengine.h
//! \brief Describes the ControlEngine class.

#ifndef CONTROLENGINE_H_
#define CONTROLENGINE_H_

#include <vector>
#include <ostream>

class Network;
class Link;

//! \class ControlEngine
//! \brief Applies a network's tank level conditional controls.
//!
//! Conditional controls override the status a link is scheduled to have.
//! Each call evaluates every control once, in network order, using the
//! tank levels of the last solved time period. Trigger categories are
//! evaluated in the order open-below, closed-above, open-above,
//! closed-below, without iterating to a fixed point.

class ControlEngine
{
  public:
    ControlEngine();

    void open(Network* nw);
    void validate();

    /// Updates the sets of links closed by controls (ctrlClosed) and by the
    /// time schedule (schedClosed). Open rules only act on links in
    /// ctrlClosed. Links whose base status is closed and that a control
    /// opened are added to reopened; they stay open for the rest of the run.
    void apply(const std::vector<double>& tankHead,
               std::vector<Link*>& ctrlClosed,
               std::vector<Link*>& schedClosed,
               std::vector<Link*>& reopened);

  private:
    Network* network;

    bool openLink(Link* link, std::vector<Link*>& ctrlClosed,
                  std::vector<Link*>& schedClosed, std::vector<Link*>& reopened);
};

#endif
