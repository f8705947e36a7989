/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "valvestatus.h"
#include "Elements/link.h"

using namespace std;

static const string s_From = " status changed from ";
static const string s_To =   " to ";
static const string valveStatusWords[] = {"OPEN", "ACTIVE", "CLOSED"};

//-----------------------------------------------------------------------------

int ValveStatus::prvStatus(int status, double q, double h1, double h2,
                           double hSet, double qTol, double hTol)
{
    switch (status)
    {
    case ACTIVE:
        if ( q < -qTol )          return CLOSED;
        if ( h1 < hSet - hTol )   return OPEN;
        break;

    case OPEN:
        if ( q < -qTol )          return CLOSED;
        if ( h1 > hSet + hTol )   return ACTIVE;
        break;

    case CLOSED:
        if ( h1 > h2 + hTol )
        {
            if ( h1 < hSet - hTol ) return OPEN;
            if ( h2 < hSet - hTol ) return ACTIVE;
        }
        break;
    }
    return status;
}

//-----------------------------------------------------------------------------

string ValveStatus::statusStr(int status)
{
    if ( status < OPEN || status > CLOSED ) return "";
    return valveStatusWords[status];
}

//-----------------------------------------------------------------------------

string ValveStatus::writeStatusChange(const Link* valve, int oldStatus,
                                      int newStatus)
{
    return "    Valve " + valve->name + s_From + statusStr(oldStatus) + s_To +
           statusStr(newStatus);
}
