/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file nlsolver.h
//! \brief Description of the NonlinearSolver class.

#ifndef NLSOLVER_H_
#define NLSOLVER_H_

#include <string>
#include <ostream>

class EquationSystem;

//! \class NonlinearSolver
//! \brief Abstract class for solving a square system of nonlinear equations.
//!
//! A solver starts from the current values of an EquationSystem's free
//! variables and, if successful, leaves the solution in them. Variable
//! bounds are checked after the solution is found.

class NonlinearSolver
{
  public:

    enum StatusCode {
        SUCCESSFUL,
        FAILED_NO_CONVERGENCE,
        FAILED_INFEASIBLE,
        FAILED_ILL_CONDITIONED
    };

    NonlinearSolver(std::ostream& logger);
    virtual ~NonlinearSolver();
    static  NonlinearSolver* factory(const std::string& name, std::ostream& logger);

    virtual std::string name() const = 0;

    void setTolerance(double tol) { tolerance = tol; }
    void setReportTrials(bool report) { reportTrials = report; }

    int  solve(EquationSystem& sys);

    static std::string statusStr(int status);

    int         iterations;      //!< iterations used by the last solve
    double      residualNorm;    //!< largest residual after the last solve
    std::string violation;       //!< variable found outside its bounds

  protected:
    std::ostream& msgLog;
    double        tolerance;
    bool          reportTrials;

    /// Runs the external solver on the system's free variables. Returns
    /// FAILED_ILL_CONDITIONED if it could not be started or was stopped.
    virtual int findSolution(EquationSystem& sys) = 0;
};

#endif
