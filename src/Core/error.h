/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file error.h
//! \brief Describes the ENerror family of exception classes.

#ifndef ERROR_H_
#define ERROR_H_

#include <exception>
#include <string>

//! \class ENerror
//! \brief Base class for all errors raised by the simulator.
//!
//! Errors are thrown inside the simulation engines and caught by the
//! Project's entry points, which log the message and return the code.

class ENerror : public std::exception
{
  public:
    ENerror(int code_, const std::string& msg_);
    ~ENerror() throw() {}
    const char* what() const throw() { return msg.c_str(); }
    int         code;
    std::string msg;
};

//! \class SystemError
//! \brief Errors raised by the simulation engines themselves.

class SystemError : public ENerror
{
  public:
    enum SystemErrorCodes {
        OUT_OF_MEMORY = 101,
        NO_NETWORK_DATA = 102,
        SOLVER_NOT_INITIALIZED = 103,
        HEADLOSS_MODEL_NOT_OPENED = 104,
        HYDRAULIC_SOLVER_NOT_OPENED = 105,
        HYDRAULICS_SOLVER_FAILURE = 106,
        VALVE_STATUS_NO_CONVERGENCE = 107,
        SYSTEM_ERROR_COUNT = 7
    };
    SystemError(int type);
    SystemError(int type, const std::string& details);
};

//! \class InputError
//! \brief Errors in the data supplied to describe a network.

class InputError : public ENerror
{
  public:
    enum InputErrorCodes {
        INVALID_KEYWORD = 201,
        INVALID_NUMBER = 202,
        UNDEFINED_OBJECT = 203,
        DUPLICATE_ID = 204,
        INVALID_TIME = 205,
        CHECK_VALVE_NOT_SUPPORTED = 206,
        INVALID_PUMP_CURVE = 207,
        ILLEGAL_VALUE = 208,
        INPUT_ERROR_COUNT = 8
    };
    InputError(int type, const std::string& token);
};

//! \class NetworkError
//! \brief Errors in the topology or the controls of a network.

class NetworkError : public ENerror
{
  public:
    enum NetworkErrorCodes {
        INCONSISTENT_TOPOLOGY = 221,
        UNCONNECTED_LINK = 222,
        SAME_END_NODES = 223,
        ILLEGAL_CONTROL_NODE = 224,
        NO_FIXED_GRADE_NODES = 225,
        NETWORK_ERROR_COUNT = 5
    };
    NetworkError(int type, const std::string& id);
};

#endif
