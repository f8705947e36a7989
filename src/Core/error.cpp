/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "error.h"

using namespace std;

static const string systemErrorMsgs[] =
{
    "System Error 101: out of memory",
    "System Error 102: no network data to analyze",
    "System Error 103: solver not initialized",
    "System Error 104: head loss model could not be opened",
    "System Error 105: nonlinear solver could not be opened",
    "System Error 106: hydraulic solver failed",
    "System Error 107: valve status did not converge"
};

static const string inputErrorMsgs[] =
{
    "Input Error 201: invalid keyword ",
    "Input Error 202: invalid number ",
    "Input Error 203: undefined object ",
    "Input Error 204: duplicate ID ",
    "Input Error 205: invalid time value ",
    "Input Error 206: check valves are not supported for link ",
    "Input Error 207: pump curve type not recognized for link ",
    "Input Error 208: illegal value "
};

static const string networkErrorMsgs[] =
{
    "Network Error 221: link is attached to a node that is neither its start nor end node ",
    "Network Error 222: link connected to a missing node ",
    "Network Error 223: link has the same start and end nodes ",
    "Network Error 224: conditional control is not based on a tank level for link ",
    "Network Error 225: no tanks or reservoirs in network "
};

//-----------------------------------------------------------------------------

ENerror::ENerror(int code_, const string& msg_) :
    code(code_),
    msg(msg_)
{}

//-----------------------------------------------------------------------------

SystemError::SystemError(int type) :
    ENerror(type, systemErrorMsgs[type - OUT_OF_MEMORY] + ".")
{}

SystemError::SystemError(int type, const string& details) :
    ENerror(type, systemErrorMsgs[type - OUT_OF_MEMORY] + " " + details)
{}

//-----------------------------------------------------------------------------

InputError::InputError(int type, const string& token) :
    ENerror(type, inputErrorMsgs[type - INVALID_KEYWORD] + token)
{}

//-----------------------------------------------------------------------------

NetworkError::NetworkError(int type, const string& id) :
    ENerror(type, networkErrorMsgs[type - INCONSISTENT_TOPOLOGY] + id)
{}
