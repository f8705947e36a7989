/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file hydengine.h
//! \brief Describes the HydEngine class.

#ifndef HYDENGINE_H_
#define HYDENGINE_H_

#include "Core/simstate.h"
#include "Core/hydbuilder.h"
#include "Core/controlengine.h"

#include <string>
#include <vector>
#include <memory>

class Network;
class Link;
class NonlinearSolver;
class EquationSystem;
class HydResults;

//! \class HydEngine
//! \brief Simulates quasi-steady hydraulics over a sequence of time periods.
//!
//! At each period the engine applies the network's conditional controls to
//! its time-scheduled link status, has its HydBuilder assemble the period's
//! equation system and calls on a NonlinearSolver to solve it. Whenever the
//! solution changes the status of a pressure reducing valve the period is
//! solved again, up to the MAX_TRIALS option. The solved heads and flows are
//! written back to the network and recorded in a HydResults object.

class HydEngine
{
  public:

    HydEngine();
    ~HydEngine();

    void   open(Network* nw);
    void   init(HydResults* res);
    int    solve(int* t);
    void   advance(int* tstep);
    void   runHorizon();
    void   close();

    int    getElapsedTime() { return currentTime; }
    const  SimulationState& getState() const { return state; }

  private:

    enum EngineState {CLOSED, OPENED, INITIALIZED};
    EngineState engineState;

    // Engine components
    Network*         network;          //!< network being analyzed
    HydResults*      results;          //!< accumulator of solved periods
    std::unique_ptr<NonlinearSolver> nlSolver;  //!< external nonlinear equation solver
    HydBuilder       builder;          //!< equation system assembler
    ControlEngine    controlEngine;    //!< tank level conditional controls
    SimulationState  state;            //!< status carried between periods
    std::unique_ptr<EquationSystem> lastSystem;  //!< last system solved

    // Engine properties
    int              currentTime;      //!< current elapsed time (sec)
    int              hydStep;          //!< hydraulic time step (sec)
    int              nPeriods;         //!< number of time periods

    void   findClosedLinks(std::vector<char>& closed);
    int    solveSystem(EquationSystem& sys);
    bool   updateValveStatus(const EquationSystem& sys, const InstantIndex& idx);
    void   storeSolution(const EquationSystem& sys, const InstantIndex& idx,
                         int period);
    void   reportDiagnostics(int statusCode, int trials);
};

#endif
