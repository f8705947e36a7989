/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file levmarsolver.h
//! \brief Description of the LevMarSolver class.

#ifndef LEVMARSOLVER_H_
#define LEVMARSOLVER_H_

#include "nlsolver.h"

//! \class LevMarSolver
//! \brief Solves a nonlinear system by minimizing its sum of squared
//!        residuals with the Levenberg-Marquardt method (Eigen's lmder).

class LevMarSolver : public NonlinearSolver
{
  public:
    LevMarSolver(std::ostream& logger);
    ~LevMarSolver();
    std::string name() const { return "LEVMAR"; }

  protected:
    int findSolution(EquationSystem& sys);
};

#endif
