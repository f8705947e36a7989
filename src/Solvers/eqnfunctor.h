/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file eqnfunctor.h
//! \brief Describes the EqnFunctor class.

#ifndef EQNFUNCTOR_H_
#define EQNFUNCTOR_H_

#include "eqnsystem.h"

#include <Eigen/Core>
#include <vector>

//! \class EqnFunctor
//! \brief Presents the free variables of an EquationSystem to Eigen's
//!        nonlinear solvers.
//!
//! The solver sees a vector holding only the system's free variables.
//! Fixed variables keep the values they have in the system.

class EqnFunctor
{
  public:
    typedef double Scalar;
    typedef Eigen::Matrix<double, Eigen::Dynamic, 1> InputType;
    typedef Eigen::Matrix<double, Eigen::Dynamic, 1> ValueType;
    typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic> JacobianType;
    enum { InputsAtCompileTime = Eigen::Dynamic, ValuesAtCompileTime = Eigen::Dynamic };

    EqnFunctor(const EquationSystem& sys);

    int inputs() const { return static_cast<int>(freeVars.size()); }
    int values() const { return sys.equationCount(); }

    /// Residuals of all equations at the free variable values x
    int operator()(const Eigen::VectorXd& x, Eigen::VectorXd& fvec);

    /// Jacobian of the residuals with respect to the free variables
    int df(const Eigen::VectorXd& x, Eigen::MatrixXd& fjac);

    Eigen::VectorXd initialValues() const;
    void            copyTo(const Eigen::VectorXd& x, EquationSystem& target) const;

  private:
    const EquationSystem& sys;
    std::vector<int>      freeVars;    //!< system index of each free variable
    std::vector<int>      column;      //!< free variable position of each
                                       //!< system variable (-1 if fixed)
    std::vector<double>   xFull;       //!< values of all system variables
    std::vector<double>   grad;

    void expand(const Eigen::VectorXd& x);
};

#endif
