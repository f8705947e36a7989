/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

#include "utilities.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <iomanip>
using namespace std;

//-----------------------------------------------------------------------------

//  Returns an upper case copy of a string.

string Utilities::upperCase(const string& s)
{
    string s1 = s;
    for (char& c : s1) c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    return s1;
}

//-----------------------------------------------------------------------------

//  Case-insensitive comparison of two strings.

bool Utilities::match(const string& s1, const string& s2)
{
    if ( s1.size() != s2.size() ) return false;
    for (size_t i = 0; i < s1.size(); i++)
    {
        if ( toupper(static_cast<unsigned char>(s1[i])) !=
             toupper(static_cast<unsigned char>(s2[i])) ) return false;
    }
    return true;
}

//-----------------------------------------------------------------------------

//  Finds the index of the keyword that fully matches s
//  (the keyword list is terminated by a null pointer).

int Utilities::findMatch(const string& s, const char* keywords[])
{
    int i = 0;
    while ( keywords[i] != nullptr )
    {
        if ( match(s, keywords[i]) ) return i;
        i++;
    }
    return -1;
}

//-----------------------------------------------------------------------------

//  Converts a string to a double, returning false if it is not a number.

bool Utilities::parseNumber(const string& str, double& x)
{
    if ( str.empty() ) return false;
    const char* s = str.c_str();
    char* endptr;
    x = strtod(s, &endptr);
    if ( *endptr != 0 ) return false;
    return std::isfinite(x);
}

bool Utilities::parseNumber(const string& str, int& x)
{
    double y;
    if ( !parseNumber(str, y) ) return false;
    if ( y != floor(y) ) return false;
    x = static_cast<int>(y);
    return true;
}

//-----------------------------------------------------------------------------

//  Splits a string into white space separated tokens.

void Utilities::split(const string& s, vector<string>& tokens)
{
    tokens.clear();
    istringstream ss(s);
    string token;
    while ( ss >> token ) tokens.push_back(token);
}

//-----------------------------------------------------------------------------

//  Converts a number of seconds into a "h:mm:ss" string.

string Utilities::getTime(int seconds)
{
    int hours = seconds / 3600;
    int minutes = (seconds - 3600 * hours) / 60;
    seconds = seconds - 3600 * hours - 60 * minutes;
    ostringstream ss;
    ss << hours << ":" << setfill('0') << setw(2) << minutes << ":"
       << setw(2) << seconds;
    return ss.str();
}

//-----------------------------------------------------------------------------

//  Converts a time given as "h:mm:ss" or as a decimal number with optional
//  units (SEC, MIN, HOURS, DAYS, AM, PM) into seconds. Returns -1 if the
//  time string is invalid.

int Utilities::getSeconds(const string& strTime, const string& strUnits)
{
    double t;
    string units = upperCase(strUnits);

    // ... decimal time with optional units

    if ( parseNumber(strTime, t) )
    {
        if ( t < 0.0 ) return -1;
        if ( units.empty() || units.substr(0, 1) == "H" ) t *= 3600.0;
        else if ( units.substr(0, 1) == "S" ) t *= 1.0;
        else if ( units.substr(0, 1) == "M" ) t *= 60.0;
        else if ( units.substr(0, 1) == "D" ) t *= 86400.0;
        else if ( units == "AM" || units == "PM" )
        {
            if ( t > 12.0 ) return -1;
            if ( t >= 12.0 ) t -= 12.0;
            if ( units == "PM" ) t += 12.0;
            t *= 3600.0;
        }
        else return -1;
        return static_cast<int>(t + 0.5);
    }

    // ... time in hours:minutes:seconds format

    double hms[3] = {0.0, 0.0, 0.0};
    int n = 0;
    size_t start = 0;
    for (;;)
    {
        if ( n == 3 ) return -1;
        size_t pos = strTime.find(':', start);
        string field = strTime.substr(start, pos == string::npos ? string::npos : pos - start);
        if ( !parseNumber(field, hms[n]) || hms[n] < 0.0 ) return -1;
        n++;
        if ( pos == string::npos ) break;
        start = pos + 1;
    }
    if ( n < 2 ) return -1;
    t = 3600.0 * hms[0] + 60.0 * hms[1] + hms[2];
    if ( units == "PM" ) t += 43200.0;
    return static_cast<int>(t + 0.5);
}
