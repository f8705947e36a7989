/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file constants.h
//! \brief Numerical constants used throughout the simulator (SI units).

#ifndef CONSTANTS_H_
#define CONSTANTS_H_

const double PI        = 3.141592653589793;
const double GRAVITY   = 9.81;           //!< acceleration of gravity (m/s2)
const double WATER_DENSITY = 1000.0;     //!< kg/m3, scales pump power to watts
const double HW_COEFF  = 10.67;          //!< Hazen-Williams resistance constant (SI)
const double HW_EXP    = 1.852;          //!< Hazen-Williams flow exponent
const double HW_DIAM_EXP = 4.871;        //!< Hazen-Williams diameter exponent
const double DW_COEFF  = 0.0826;         //!< Darcy-Weisbach constant (SI)

// Smoothing interval of the modified Hazen-Williams loss curve (m3/s)
const double HW_Q1     = 0.00349347323944;
const double HW_Q2     = 0.00549347323944;
const double HW_LAMINAR_SLOPE = 0.01;

// Initial values for the nonlinear solver
const double INIT_FLOW       = 0.3048;   //!< 1 ft/s worth of flow (m3/s)
const double INIT_HEAD       = 100.0;    //!< reservoir head guess (m)
const double INIT_NODE_FLOW  = 0.1;      //!< tank inflow / reservoir outflow guess

#endif
