/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "levmarsolver.h"
#include "eqnfunctor.h"

#include <unsupported/Eigen/NonLinearOptimization>

using namespace std;

//-----------------------------------------------------------------------------

LevMarSolver::LevMarSolver(ostream& logger) : NonlinearSolver(logger)
{}

LevMarSolver::~LevMarSolver() {}

//-----------------------------------------------------------------------------

int LevMarSolver::findSolution(EquationSystem& sys)
{
    EqnFunctor functor(sys);
    if ( functor.values() < functor.inputs() )
    {
        msgLog << "\n    " << name() << " solver: system has fewer equations ("
               << functor.values() << ") than unknowns ("
               << functor.inputs() << ").";
        return FAILED_ILL_CONDITIONED;
    }

    Eigen::VectorXd x = functor.initialValues();
    Eigen::LevenbergMarquardt<EqnFunctor> solver(functor);
    solver.parameters.ftol = 1.0e-12;
    solver.parameters.xtol = 1.0e-12;
    solver.parameters.maxfev = 200 * (functor.inputs() + 1);
    Eigen::LevenbergMarquardtSpace::Status info = solver.minimize(x);
    iterations = static_cast<int>(solver.iter);

    switch (info)
    {
    case Eigen::LevenbergMarquardtSpace::ImproperInputParameters:
    case Eigen::LevenbergMarquardtSpace::UserAsked:
        return FAILED_ILL_CONDITIONED;
    default:
        break;
    }
    functor.copyTo(x, sys);
    return SUCCESSFUL;
}
