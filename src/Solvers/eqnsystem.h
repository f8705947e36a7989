/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file eqnsystem.h
//! \brief Describes the EquationSystem class and the equations it holds.

#ifndef EQNSYSTEM_H_
#define EQNSYSTEM_H_

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

class HeadLossModel;

//! \struct Variable
//! \brief A named unknown of an equation system.
//!
//! A fixed variable keeps its value during a solve. Bounds are not imposed
//! on the solver; they are checked once a solution has been found.

struct Variable
{
    std::string name;
    double      value;
    double      lower;
    double      upper;
    bool        fixed;
};

//! \class Equation
//! \brief An equality constraint r(x) = 0 over a few system variables.

class Equation
{
  public:
    Equation(const std::string& name_) : name(name_) {}
    virtual ~Equation() {}

    /// Returns the residual at x and the partial derivatives of the
    /// residual with respect to each variable in vars (written to grad).
    virtual double evaluate(const std::vector<double>& x, double grad[]) const = 0;

    std::string      name;
    std::vector<int> vars;     //!< indexes of the variables involved
};

//! \class LinearEquation
//! \brief sum(coeff[i] * x[vars[i]]) = rhs

class LinearEquation : public Equation
{
  public:
    LinearEquation(const std::string& name_, double rhs_ = 0.0);
    void   addTerm(int var, double coeff);
    double evaluate(const std::vector<double>& x, double grad[]) const;

    std::vector<double> coeffs;
    double              rhs;
};

//! \class PipeHeadLossEquation
//! \brief Friction loss across a pipe: r*sign(q)*loss(|q|) = h1 - h2

class PipeHeadLossEquation : public Equation
{
  public:
    PipeHeadLossEquation(const std::string& name_, int q, int h1, int h2,
                         double r, const HeadLossModel* model);
    double evaluate(const std::vector<double>& x, double grad[]) const;

  private:
    double               resistance;
    const HeadLossModel* headLossModel;
};

//! \class PumpHeadEquation
//! \brief Head gain of a pump curve: h1 - h2 = -A + B*q^C
//!
//! The curve is extended to negative flow as -A - B*|q|^C so that the
//! residual stays defined while the solver iterates.

class PumpHeadEquation : public Equation
{
  public:
    PumpHeadEquation(const std::string& name_, int q, int h1, int h2,
                     double a_, double b_, double c_);
    double evaluate(const std::vector<double>& x, double grad[]) const;

  private:
    double a, b, c;
};

//! \class PumpPowerEquation
//! \brief Constant power pump in head units: (h1 - h2)*q = -power/(g*rho)

class PumpPowerEquation : public Equation
{
  public:
    PumpPowerEquation(const std::string& name_, int q, int h1, int h2, double power_);
    double evaluate(const std::vector<double>& x, double grad[]) const;

  private:
    double power;
};

//! \class ValveHeadLossEquation
//! \brief Loss across a fully open valve: Kv*q^2 = h1 - h2

class ValveHeadLossEquation : public Equation
{
  public:
    ValveHeadLossEquation(const std::string& name_, int q, int h1, int h2, double kv_);
    double evaluate(const std::vector<double>& x, double grad[]) const;

  private:
    double kv;
};

//! \class EquationSystem
//! \brief A square system of nonlinear equations over named variables.

class EquationSystem
{
  public:
    EquationSystem();
    ~EquationSystem();

    int  addVariable(const std::string& name, double value);
    int  variableIndex(const std::string& name) const;
    void setBounds(int var, double lower, double upper);
    void fix(int var, double value);
    void unfix(int var);

    void addEquation(Equation* eqn);

    int  variableCount() const { return static_cast<int>(variables.size()); }
    int  equationCount() const { return static_cast<int>(equations.size()); }
    int  freeVariableCount() const;

    double value(int var) const { return variables[var].value; }
    double value(const std::string& name) const;
    void   setValue(int var, double x) { variables[var].value = x; }
    const Variable& variable(int var) const { return variables[var]; }
    const Equation& equation(int i) const { return *equations[i]; }

    std::vector<double> values() const;
    void   setValues(const std::vector<double>& x);
    void   warmStart(const EquationSystem& other);
    double residual(int i, const std::vector<double>& x) const;
    double maxResidual() const;
    bool   findBoundViolation(double tol, std::string& name) const;

  private:
    std::vector<Variable>                  variables;
    std::vector<std::unique_ptr<Equation>> equations;
    std::unordered_map<std::string, int>   varTable;
};

#endif
