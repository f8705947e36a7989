/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "eqnsystem.h"
#include "Models/headlossmodel.h"
#include "Core/constants.h"

#include <cmath>
#include <limits>
#include <algorithm>
using namespace std;

//-----------------------------------------------------------------------------
//  Equations
//-----------------------------------------------------------------------------

LinearEquation::LinearEquation(const string& name_, double rhs_) :
    Equation(name_),
    rhs(rhs_)
{}

void LinearEquation::addTerm(int var, double coeff)
{
    vars.push_back(var);
    coeffs.push_back(coeff);
}

double LinearEquation::evaluate(const vector<double>& x, double grad[]) const
{
    double r = -rhs;
    for (size_t i = 0; i < vars.size(); i++)
    {
        r += coeffs[i] * x[vars[i]];
        grad[i] = coeffs[i];
    }
    return r;
}

//-----------------------------------------------------------------------------

PipeHeadLossEquation::PipeHeadLossEquation(const string& name_, int q, int h1,
        int h2, double r, const HeadLossModel* model) :
    Equation(name_),
    resistance(r),
    headLossModel(model)
{
    vars = {q, h1, h2};
}

double PipeHeadLossEquation::evaluate(const vector<double>& x, double grad[]) const
{
    double hLoss, hGrad;
    headLossModel->findHeadLoss(resistance, x[vars[0]], hLoss, hGrad);
    grad[0] = hGrad;
    grad[1] = -1.0;
    grad[2] = 1.0;
    return hLoss - (x[vars[1]] - x[vars[2]]);
}

//-----------------------------------------------------------------------------

PumpHeadEquation::PumpHeadEquation(const string& name_, int q, int h1, int h2,
        double a_, double b_, double c_) :
    Equation(name_),
    a(a_), b(b_), c(c_)
{
    vars = {q, h1, h2};
}

double PumpHeadEquation::evaluate(const vector<double>& x, double grad[]) const
{
    double q = x[vars[0]];
    double Q = abs(q);
    double gain = b * pow(Q, c);
    if ( q < 0.0 ) gain = -gain;
    grad[0] = Q > 0.0 ? -b * c * pow(Q, c - 1.0) : 0.0;
    grad[1] = 1.0;
    grad[2] = -1.0;
    return (x[vars[1]] - x[vars[2]]) - (-a + gain);
}

//-----------------------------------------------------------------------------

PumpPowerEquation::PumpPowerEquation(const string& name_, int q, int h1, int h2,
        double power_) :
    Equation(name_),
    power(power_)
{
    vars = {q, h1, h2};
}

double PumpPowerEquation::evaluate(const vector<double>& x, double grad[]) const
{
    double q = x[vars[0]];
    double dh = x[vars[1]] - x[vars[2]];
    grad[0] = dh;
    grad[1] = q;
    grad[2] = -q;
    return dh * q + power / (GRAVITY * WATER_DENSITY);
}

//-----------------------------------------------------------------------------

ValveHeadLossEquation::ValveHeadLossEquation(const string& name_, int q, int h1,
        int h2, double kv_) :
    Equation(name_),
    kv(kv_)
{
    vars = {q, h1, h2};
}

double ValveHeadLossEquation::evaluate(const vector<double>& x, double grad[]) const
{
    double q = x[vars[0]];
    grad[0] = 2.0 * kv * q;
    grad[1] = -1.0;
    grad[2] = 1.0;
    return kv * q * q - (x[vars[1]] - x[vars[2]]);
}

//-----------------------------------------------------------------------------
//  Equation System
//-----------------------------------------------------------------------------

EquationSystem::EquationSystem() {}

EquationSystem::~EquationSystem() {}

//-----------------------------------------------------------------------------

//  Adds a free, unbounded variable and returns its index.

int EquationSystem::addVariable(const string& name, double value)
{
    Variable v;
    v.name = name;
    v.value = value;
    v.lower = -numeric_limits<double>::infinity();
    v.upper = numeric_limits<double>::infinity();
    v.fixed = false;
    int index = static_cast<int>(variables.size());
    variables.push_back(v);
    varTable[name] = index;
    return index;
}

int EquationSystem::variableIndex(const string& name) const
{
    auto it = varTable.find(name);
    if ( it == varTable.end() ) return -1;
    return it->second;
}

void EquationSystem::setBounds(int var, double lower, double upper)
{
    variables[var].lower = lower;
    variables[var].upper = upper;
}

void EquationSystem::fix(int var, double value)
{
    variables[var].value = value;
    variables[var].fixed = true;
}

void EquationSystem::unfix(int var)
{
    variables[var].fixed = false;
}

//-----------------------------------------------------------------------------

//  Adds an equation to the system, which takes ownership of it.

void EquationSystem::addEquation(Equation* eqn)
{
    equations.push_back(unique_ptr<Equation>(eqn));
}

//-----------------------------------------------------------------------------

int EquationSystem::freeVariableCount() const
{
    int n = 0;
    for (const Variable& v : variables)
    {
        if ( !v.fixed ) n++;
    }
    return n;
}

double EquationSystem::value(const string& name) const
{
    int i = variableIndex(name);
    if ( i < 0 ) return numeric_limits<double>::quiet_NaN();
    return variables[i].value;
}

vector<double> EquationSystem::values() const
{
    vector<double> x(variables.size());
    for (size_t i = 0; i < variables.size(); i++) x[i] = variables[i].value;
    return x;
}

void EquationSystem::setValues(const vector<double>& x)
{
    for (size_t i = 0; i < variables.size(); i++) variables[i].value = x[i];
}

//-----------------------------------------------------------------------------

//  Copies the values of another system's variables into the free
//  variables of this system that have the same names.

void EquationSystem::warmStart(const EquationSystem& other)
{
    for (Variable& v : variables)
    {
        if ( v.fixed ) continue;
        int i = other.variableIndex(v.name);
        if ( i >= 0 ) v.value = other.variables[i].value;
    }
}

//-----------------------------------------------------------------------------

double EquationSystem::residual(int i, const vector<double>& x) const
{
    vector<double> grad(equations[i]->vars.size());
    return equations[i]->evaluate(x, grad.data());
}

//  Returns the largest absolute equation residual at the current values.

double EquationSystem::maxResidual() const
{
    vector<double> x = values();
    double rMax = 0.0;
    for (int i = 0; i < equationCount(); i++)
    {
        double r = abs(residual(i, x));
        if ( !isfinite(r) ) return r;
        rMax = max(rMax, r);
    }
    return rMax;
}

//-----------------------------------------------------------------------------

//  Finds the first variable whose value lies outside its bounds by more
//  than tol. Returns false if there is none.

bool EquationSystem::findBoundViolation(double tol, string& name) const
{
    for (const Variable& v : variables)
    {
        if ( v.value < v.lower - tol || v.value > v.upper + tol )
        {
            name = v.name;
            return true;
        }
    }
    return false;
}
