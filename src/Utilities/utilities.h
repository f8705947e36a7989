/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file utilities.h
//! \brief Describes the Utilities class.

#ifndef UTILITIES_H_
#define UTILITIES_H_

#include <string>
#include <vector>

//! \class Utilities
//! \brief A collection of string and time helper functions.

class Utilities
{
  public:
    static std::string upperCase(const std::string& s);
    static bool        match(const std::string& s1, const std::string& s2);
    static int         findMatch(const std::string& s, const char* keywords[]);
    static bool        parseNumber(const std::string& str, double& x);
    static bool        parseNumber(const std::string& str, int& x);
    static void        split(const std::string& s, std::vector<std::string>& tokens);
    static std::string getTime(int seconds);
    static int         getSeconds(const std::string& strTime, const std::string& strUnits);
};

#endif
