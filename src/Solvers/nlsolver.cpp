/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "nlsolver.h"
#include "eqnsystem.h"

// Include headers for the different nonlinear solvers here
#include "powellsolver.h"
#include "levmarsolver.h"

#include <cmath>
using namespace std;

static const string statusWords[] =
    {"SUCCESSFUL", "NO CONVERGENCE", "INFEASIBLE", "ILL CONDITIONED"};

//-----------------------------------------------------------------------------

NonlinearSolver::NonlinearSolver(ostream& logger) :
    iterations(0),
    residualNorm(0.0),
    msgLog(logger),
    tolerance(1.0e-6),
    reportTrials(false)
{}

NonlinearSolver::~NonlinearSolver() {}

NonlinearSolver* NonlinearSolver::factory(const string& name, ostream& logger)
{
    if (name == "POWELL") return new PowellSolver(logger);
    if (name == "LEVMAR") return new LevMarSolver(logger);
    return nullptr;
}

string NonlinearSolver::statusStr(int status)
{
    if ( status < SUCCESSFUL || status > FAILED_ILL_CONDITIONED ) return "";
    return statusWords[status];
}

//-----------------------------------------------------------------------------

//  Solves a system of equations and checks the solution against the
//  residual tolerance and the variables' bounds.

int NonlinearSolver::solve(EquationSystem& sys)
{
    iterations = 0;
    residualNorm = 0.0;
    violation = "";

    if ( sys.freeVariableCount() > 0 )
    {
        int status = findSolution(sys);
        if ( status != SUCCESSFUL ) return status;
    }

    residualNorm = sys.maxResidual();
    if ( reportTrials )
    {
        msgLog << "\n    " << name() << " solver: " << iterations
               << " iterations, max. residual " << residualNorm;
    }
    if ( !std::isfinite(residualNorm) ) return FAILED_ILL_CONDITIONED;
    for (int i = 0; i < sys.variableCount(); i++)
    {
        if ( !std::isfinite(sys.value(i)) ) return FAILED_ILL_CONDITIONED;
    }
    if ( residualNorm > tolerance ) return FAILED_NO_CONVERGENCE;
    if ( sys.findBoundViolation(tolerance, violation) ) return FAILED_INFEASIBLE;
    return SUCCESSFUL;
}
