/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "eqnfunctor.h"

#include <algorithm>
#include <cmath>
using namespace std;

//-----------------------------------------------------------------------------

EqnFunctor::EqnFunctor(const EquationSystem& sys_) :
    sys(sys_)
{
    int n = sys.variableCount();
    column.assign(n, -1);
    for (int i = 0; i < n; i++)
    {
        if ( sys.variable(i).fixed ) continue;
        column[i] = static_cast<int>(freeVars.size());
        freeVars.push_back(i);
    }
    xFull = sys.values();

    size_t maxVars = 0;
    for (int i = 0; i < sys.equationCount(); i++)
    {
        maxVars = max(maxVars, sys.equation(i).vars.size());
    }
    grad.resize(maxVars);
}

//-----------------------------------------------------------------------------

void EqnFunctor::expand(const Eigen::VectorXd& x)
{
    for (size_t j = 0; j < freeVars.size(); j++) xFull[freeVars[j]] = x[j];
}

//-----------------------------------------------------------------------------

//  Returns -1, which stops the Eigen solver, if a residual is not finite.

int EqnFunctor::operator()(const Eigen::VectorXd& x, Eigen::VectorXd& fvec)
{
    expand(x);
    for (int i = 0; i < sys.equationCount(); i++)
    {
        fvec[i] = sys.equation(i).evaluate(xFull, grad.data());
        if ( !std::isfinite(fvec[i]) ) return -1;
    }
    return 0;
}

//-----------------------------------------------------------------------------

int EqnFunctor::df(const Eigen::VectorXd& x, Eigen::MatrixXd& fjac)
{
    expand(x);
    fjac.setZero();
    for (int i = 0; i < sys.equationCount(); i++)
    {
        const Equation& eqn = sys.equation(i);
        eqn.evaluate(xFull, grad.data());
        for (size_t k = 0; k < eqn.vars.size(); k++)
        {
            int j = column[eqn.vars[k]];
            if ( j < 0 ) continue;
            if ( !std::isfinite(grad[k]) ) return -1;
            fjac(i, j) += grad[k];
        }
    }
    return 0;
}

//-----------------------------------------------------------------------------

Eigen::VectorXd EqnFunctor::initialValues() const
{
    Eigen::VectorXd x(freeVars.size());
    for (size_t j = 0; j < freeVars.size(); j++) x[j] = sys.value(freeVars[j]);
    return x;
}

//  Writes a solution vector back into the free variables of a system.

void EqnFunctor::copyTo(const Eigen::VectorXd& x, EquationSystem& target) const
{
    vector<double> values = target.values();
    for (size_t j = 0; j < freeVars.size(); j++) values[freeVars[j]] = x[j];
    target.setValues(values);
}
