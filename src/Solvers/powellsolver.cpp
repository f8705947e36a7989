/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "powellsolver.h"
#include "eqnfunctor.h"

#include <unsupported/Eigen/NonLinearOptimization>

using namespace std;

//-----------------------------------------------------------------------------

PowellSolver::PowellSolver(ostream& logger) : NonlinearSolver(logger)
{}

PowellSolver::~PowellSolver() {}

//-----------------------------------------------------------------------------

int PowellSolver::findSolution(EquationSystem& sys)
{
    EqnFunctor functor(sys);
    if ( functor.inputs() != functor.values() )
    {
        msgLog << "\n    " << name() << " solver: system has "
               << functor.values() << " equations in "
               << functor.inputs() << " unknowns.";
        return FAILED_ILL_CONDITIONED;
    }

    Eigen::VectorXd x = functor.initialValues();
    Eigen::HybridNonLinearSolver<EqnFunctor> solver(functor);
    Eigen::HybridNonLinearSolverSpace::Status info = solver.hybrj1(x, 1.0e-10);
    iterations = static_cast<int>(solver.iter);

    switch (info)
    {
    case Eigen::HybridNonLinearSolverSpace::ImproperInputParameters:
    case Eigen::HybridNonLinearSolverSpace::UserAsked:
        return FAILED_ILL_CONDITIONED;
    default:
        break;
    }

    // ... a stalled search can still end at a root, so let the residual
    //     check decide about convergence
    functor.copyTo(x, sys);
    return SUCCESSFUL;
}
