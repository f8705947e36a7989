/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

 //////////////////////////////////////////////
 //  Implementation of the HydEngine class.  //
 //////////////////////////////////////////////

#include "hydengine.h"
#include "network.h"
#include "valvestatus.h"
#include "error.h"
#include "Elements/node.h"
#include "Elements/link.h"
#include "Elements/pattern.h"
#include "Models/headlossmodel.h"
#include "Solvers/eqnsystem.h"
#include "Solvers/nlsolver.h"
#include "Output/hydresults.h"
#include "Utilities/utilities.h"

#include <algorithm>
using namespace std;

static const string s_Solving      = "\n  Solving network at ";
static const string s_Solved       = "\n  Network solved in ";
static const string s_Trials       = " trial(s).";
static const string s_Horizon      = "\n  Solving network over the full time horizon";
static const string s_NoConvergence = "\n  Solver did not converge.";
static const string s_Infeasible   = "\n  Solution violates the bounds on ";
static const string s_IllConditioned =
    "\n  Network is numerically ill-conditioned. Simulation halted.";

//-----------------------------------------------------------------------------

//  Constructor

HydEngine::HydEngine() :
    engineState(HydEngine::CLOSED),
    network(nullptr),
    results(nullptr),
    currentTime(0),
    hydStep(0),
    nPeriods(0)
{
}

//  Destructor

HydEngine::~HydEngine()
{
    close();
}

//-----------------------------------------------------------------------------

//  Opens the hydraulic engine.

void HydEngine::open(Network* nw)
{
    // ... close a currently opened engine
    if ( engineState != HydEngine::CLOSED ) close();
    network = nw;

    // ... a network needs at least one tank or reservoir to fix its heads
    bool hasFixedGrade = false;
    for (Node* node : network->nodes)
    {
        if ( node->type != Node::JUNCTION ) hasFixedGrade = true;
    }
    if ( !hasFixedGrade ) throw NetworkError(NetworkError::NO_FIXED_GRADE_NODES, "");

    // ... create the head loss model
    if ( !network->createHeadLossModel() )
    {
        throw SystemError(SystemError::HEADLOSS_MODEL_NOT_OPENED);
    }

    // ... create the nonlinear solver
    nlSolver.reset(NonlinearSolver::factory(network->option(Options::NL_SOLVER),
                                            network->msgLog));
    if ( nlSolver == nullptr )
    {
        throw SystemError(SystemError::HYDRAULIC_SOLVER_NOT_OPENED);
    }
    nlSolver->setTolerance(network->option(Options::SOLVER_TOLERANCE));
    nlSolver->setReportTrials(network->option(Options::REPORT_TRIALS) > 0);

    // ... check the conditional controls
    controlEngine.open(network);

    engineState = HydEngine::OPENED;
}

//-----------------------------------------------------------------------------

//  Initializes the network's elements and the simulation state.

void HydEngine::init(HydResults* res)
{
    if ( engineState == HydEngine::CLOSED ) return;

    results = res;
    if ( results ) results->clear();
    hydStep = network->option(Options::HYD_STEP);
    nPeriods = network->hydPeriods();
    currentTime = 0;
    lastSystem.reset();

    int patternStep = network->option(Options::PATTERN_STEP);
    int patternStart = network->option(Options::PATTERN_START);
    for (Pattern* pattern : network->patterns) pattern->init(patternStep, patternStart);

    for (Link* link : network->links)
    {
        link->initialize();
        network->headLossModel->setResistance(link);
    }
    for (Node* node : network->nodes) node->initialize();

    builder.open(network);
    builder.checkComponents();
    state.init(network);
    engineState = HydEngine::INITIALIZED;
}

//-----------------------------------------------------------------------------

//  Solves network hydraulics at the current time period.

int HydEngine::solve(int* t)
{
    if ( engineState != HydEngine::INITIALIZED ) return 0;
    *t = currentTime;

    if ( network->option(Options::REPORT_STATUS) )
    {
        network->msgLog << s_Solving << Utilities::getTime(currentTime);
    }

    // ... find which links are closed by schedule or by control
    vector<char> closed;
    findClosedLinks(closed);
    bool headBounds = network->option(Options::HEAD_BOUNDS) > 0;
    int maxTrials = network->option(Options::MAX_TRIALS);

    // ... re-solve the period until no valve changes status
    state.trials = 0;
    for (;;)
    {
        unique_ptr<EquationSystem> sys(new EquationSystem());
        InstantIndex idx;
        builder.buildInstant(*sys, idx, state.period, state.firstTimestep,
                             state.lastTankHead, closed, state.valveStatus,
                             headBounds);
        if ( !state.firstTimestep && lastSystem ) sys->warmStart(*lastSystem);

        int statusCode = solveSystem(*sys);
        if ( statusCode != NonlinearSolver::SUCCESSFUL )
        {
            throw SystemError(SystemError::HYDRAULICS_SOLVER_FAILURE,
                "at " + Utilities::getTime(currentTime) + " (" +
                NonlinearSolver::statusStr(statusCode) + ").");
        }
        lastSystem = std::move(sys);

        if ( !updateValveStatus(*lastSystem, idx) )
        {
            storeSolution(*lastSystem, idx, state.period);
            break;
        }

        state.trials++;
        if ( state.trials >= maxTrials )
        {
            throw SystemError(SystemError::VALVE_STATUS_NO_CONVERGENCE,
                "at " + Utilities::getTime(currentTime) + ".");
        }
    }
    reportDiagnostics(NonlinearSolver::SUCCESSFUL, state.trials + 1);
    return 0;
}

//-----------------------------------------------------------------------------

//  Records the solved period and moves to the next one. tstep is returned
//  as 0 once the last period has been solved.

void HydEngine::advance(int* tstep)
{
    *tstep = 0;
    if ( engineState != HydEngine::INITIALIZED ) return;

    for (Node* node : network->nodes)
    {
        if ( node->type == Node::TANK ) state.lastTankHead[node->index] = node->head;
    }
    if ( results ) results->record(network, currentTime);

    state.firstTimestep = false;
    state.period++;
    if ( state.period >= nPeriods ) return;
    *tstep = hydStep;
    currentTime += hydStep;
}

//-----------------------------------------------------------------------------

//  Solves all time periods at once, using only the scheduled link status
//  and the initial valve status.

void HydEngine::runHorizon()
{
    if ( engineState != HydEngine::INITIALIZED ) return;

    if ( network->option(Options::REPORT_STATUS) ) network->msgLog << s_Horizon;

    EquationSystem sys;
    vector<InstantIndex> idx;
    builder.buildHorizon(sys, idx, state);

    int statusCode = solveSystem(sys);
    if ( statusCode != NonlinearSolver::SUCCESSFUL )
    {
        throw SystemError(SystemError::HYDRAULICS_SOLVER_FAILURE,
            "over the full horizon (" + NonlinearSolver::statusStr(statusCode) + ").");
    }
    reportDiagnostics(statusCode, 1);

    for (int t = 0; t < nPeriods; t++)
    {
        storeSolution(sys, idx[t], t);
        currentTime = t * hydStep;
        if ( results ) results->record(network, currentTime);
    }
    state.period = nPeriods;
}

//-----------------------------------------------------------------------------

//  Closes the hydraulic engine.

void HydEngine::close()
{
    nlSolver.reset();
    lastSystem.reset();
    results = nullptr;
    engineState = HydEngine::CLOSED;
}

//-----------------------------------------------------------------------------

//  Marks the links that are closed at the current period, either by their
//  time schedule or by a conditional control.

void HydEngine::findClosedLinks(vector<char>& closed)
{
    vector<Link*> schedClosed;
    for (Link* link : network->links)
    {
        if ( !state.isScheduledOpen(link->index, state.period) )
        {
            schedClosed.push_back(link);
        }
    }

    // ... controls act on the tank levels of the previous period
    if ( !state.firstTimestep )
    {
        vector<Link*> reopened;
        controlEngine.apply(state.lastTankHead, state.ctrlClosed, schedClosed,
                            reopened);
        for (Link* link : reopened) state.reopenLink(link->index, state.period);
    }

    closed.assign(network->count(Element::LINK), 0);
    for (Link* link : schedClosed) closed[link->index] = 1;
    for (Link* link : state.ctrlClosed) closed[link->index] = 1;
}

//-----------------------------------------------------------------------------

int HydEngine::solveSystem(EquationSystem& sys)
{
    int statusCode = nlSolver->solve(sys);
    if ( statusCode != NonlinearSolver::SUCCESSFUL )
    {
        reportDiagnostics(statusCode, state.trials + 1);
    }
    return statusCode;
}

//-----------------------------------------------------------------------------

//  Finds a new status for each pressure reducing valve, including those
//  closed by schedule or control. Returns true if any status changed.

bool HydEngine::updateValveStatus(const EquationSystem& sys, const InstantIndex& idx)
{
    double qTol = network->option(Options::FLOW_TOLERANCE);
    double hTol = network->option(Options::HEAD_TOLERANCE);
    bool changed = false;

    for (Link* link : network->links)
    {
        if ( link->type != Link::VALVE ) continue;
        double q = sys.value(idx.flow[link->index]);
        double h1 = sys.value(idx.head[link->fromNode->index]);
        double h2 = sys.value(idx.head[link->toNode->index]);
        double hSet = link->setting + link->fromNode->elev;

        int oldStatus = state.valveStatus[link->index];
        int newStatus = ValveStatus::prvStatus(oldStatus, q, h1, h2, hSet, qTol, hTol);
        if ( newStatus != oldStatus )
        {
            if ( network->option(Options::REPORT_STATUS) )
            {
                network->msgLog << "\n" <<
                    ValveStatus::writeStatusChange(link, oldStatus, newStatus);
            }
            state.valveStatus[link->index] = newStatus;
            changed = true;
        }
    }
    return changed;
}

//-----------------------------------------------------------------------------

//  Copies a solved period's heads, flows and demands into the network.

void HydEngine::storeSolution(const EquationSystem& sys, const InstantIndex& idx,
                              int period)
{
    for (Node* node : network->nodes)
    {
        int i = node->index;
        node->head = sys.value(idx.head[i]);
        switch ( node->type )
        {
        case Node::JUNCTION:
            node->fullDemand = builder.requiredDemand(node, period);
            node->actualDemand = sys.value(idx.nodeFlow[i]);
            break;
        default:
            node->outflow = sys.value(idx.nodeFlow[i]);
            break;
        }
    }
    for (Link* link : network->links)
    {
        link->flow = sys.value(idx.flow[link->index]);
    }
}

//-----------------------------------------------------------------------------

//  Reports the outcome of a solve to the message log.

void HydEngine::reportDiagnostics(int statusCode, int trials)
{
    if ( !network->option(Options::REPORT_STATUS) ) return;
    switch (statusCode)
    {
    case NonlinearSolver::SUCCESSFUL:
        network->msgLog << s_Solved << trials << s_Trials;
        break;
    case NonlinearSolver::FAILED_NO_CONVERGENCE:
        network->msgLog << s_NoConvergence;
        break;
    case NonlinearSolver::FAILED_INFEASIBLE:
        network->msgLog << s_Infeasible << nlSolver->violation << ".";
        break;
    case NonlinearSolver::FAILED_ILL_CONDITIONED:
        network->msgLog << s_IllConditioned;
        break;
    }
}
