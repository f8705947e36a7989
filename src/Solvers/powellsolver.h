/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file powellsolver.h
//! \brief Description of the PowellSolver class.

#ifndef POWELLSOLVER_H_
#define POWELLSOLVER_H_

#include "nlsolver.h"

//! \class PowellSolver
//! \brief Solves a square nonlinear system with Powell's hybrid method.
//!
//! Wraps Eigen's HybridNonLinearSolver (MINPACK's hybrj) using the
//! analytical Jacobian of the system's equations.

class PowellSolver : public NonlinearSolver
{
  public:
    PowellSolver(std::ostream& logger);
    ~PowellSolver();
    std::string name() const { return "POWELL"; }

  protected:
    int findSolution(EquationSystem& sys);
};

#endif
