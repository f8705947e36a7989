/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Distributed under the MIT License (see the LICENSE file for details).
 *
 */

 ////////////////////////////////////////////
 //  Implementation of the Options class.  //
 ////////////////////////////////////////////

#include "options.h"
#include "error.h"
#include "Utilities/utilities.h"

#include <sstream>
#include <iomanip>
#include <vector>
using namespace std;

static const char* headLossModelWords[] = {"SMOOTH-H-W", "H-W", nullptr};
static const char* nlSolverWords[]      = {"POWELL", "LEVMAR", nullptr};
static const char* yesNoWords[]         = {"NO", "YES", nullptr};
static const char* statusWords[]        = {"NO", "YES", "FULL", nullptr};

// Keywords recognized by setOption(keyword, value)
enum OptionKeyword {
    HEADLOSS_KEY, SOLVER_KEY, TRIALS_KEY, HEAD_BOUNDS_KEY, STATUS_KEY,
    HEAD_TOL_KEY, FLOW_TOL_KEY, ACCURACY_KEY, MULTIPLIER_KEY,
    DURATION_KEY, HYD_STEP_KEY, PATTERN_STEP_KEY, PATTERN_START_KEY,
    START_CLOCKTIME_KEY
};

static const char* optionKeywords[] = {
    "HEADLOSS", "SOLVER", "TRIALS", "HEAD BOUNDS", "STATUS",
    "HEAD TOLERANCE", "FLOW TOLERANCE", "ACCURACY", "DEMAND MULTIPLIER",
    "DURATION", "HYDRAULIC TIMESTEP", "PATTERN TIMESTEP", "PATTERN START",
    "START CLOCKTIME", nullptr
};

//-----------------------------------------------------------------------------

//  Constructor

Options::Options()
{
    setDefaults();
}

//-----------------------------------------------------------------------------

//  Set default option values

void Options::setDefaults()
{
    stringOptions[HEADLOSS_MODEL]    = "SMOOTH-H-W";
    stringOptions[NL_SOLVER]         = "POWELL";

    indexOptions[MAX_TRIALS]         = 10;
    indexOptions[HEAD_BOUNDS]        = 0;
    indexOptions[REPORT_STATUS]      = 0;
    indexOptions[REPORT_TRIALS]      = 0;

    valueOptions[HEAD_TOLERANCE]     = 0.00015;  //m
    valueOptions[FLOW_TOLERANCE]     = 2.8e-5;   //m3/s
    valueOptions[SOLVER_TOLERANCE]   = 1.0e-6;
    valueOptions[DEMAND_MULTIPLIER]  = 1.0;

    timeOptions[START_TIME]          = 0;        //sec
    timeOptions[HYD_STEP]            = 3600;     //sec
    timeOptions[PATTERN_STEP]        = 3600;     //sec
    timeOptions[PATTERN_START]       = 0;        //sec
    timeOptions[TOTAL_DURATION]      = 0;        //sec
}

//-----------------------------------------------------------------------------

//  Set the value of a string option. Returns an InputError code if the
//  value is not a recognized choice for the option.

int Options::setOption(StringOption option, const string& value)
{
    const char** choices = nullptr;
    switch (option)
    {
    case HEADLOSS_MODEL: choices = headLossModelWords; break;
    case NL_SOLVER:      choices = nlSolverWords;      break;
    default: return InputError::INVALID_KEYWORD;
    }
    int i = Utilities::findMatch(value, choices);
    if ( i < 0 ) return InputError::INVALID_KEYWORD;
    stringOptions[option] = choices[i];
    return 0;
}

//-----------------------------------------------------------------------------

//  Set the value of an index (i.e., integer) option.

void Options::setOption(IndexOption option, int value)
{
    indexOptions[option] = value;
}

//-----------------------------------------------------------------------------

//  Set the value of a numerical option.

void Options::setOption(ValueOption option, double value)
{
    valueOptions[option] = value;
}

//-----------------------------------------------------------------------------

//  Set the value of a time option.

void Options::setOption(TimeOption option, int value)
{
    timeOptions[option] = value;
}

//-----------------------------------------------------------------------------

//  Set an option from a keyword/value pair as written in the [OPTIONS] or
//  [TIMES] section of an EPANET input file, e.g. "HYDRAULIC TIMESTEP" and
//  "1:00". Returns 0 or an InputError code.

int Options::setOption(const string& keyword, const string& value)
{
    // ... normalize white space within the keyword
    vector<string> words;
    Utilities::split(keyword, words);
    string key;
    for (size_t i = 0; i < words.size(); i++)
    {
        if ( i > 0 ) key += " ";
        key += words[i];
    }

    vector<string> tokens;
    Utilities::split(value, tokens);
    if ( tokens.empty() ) return InputError::ILLEGAL_VALUE;

    int k = Utilities::findMatch(key, optionKeywords);
    if ( k < 0 ) return InputError::INVALID_KEYWORD;

    double x = 0.0;
    int    n = 0;
    int    seconds = 0;
    switch (k)
    {
    case HEADLOSS_KEY:
        return setOption(HEADLOSS_MODEL, tokens[0]);

    case SOLVER_KEY:
        return setOption(NL_SOLVER, tokens[0]);

    case TRIALS_KEY:
        if ( !Utilities::parseNumber(tokens[0], n) ) return InputError::INVALID_NUMBER;
        if ( n < 1 ) return InputError::ILLEGAL_VALUE;
        indexOptions[MAX_TRIALS] = n;
        return 0;

    case HEAD_BOUNDS_KEY:
        n = Utilities::findMatch(tokens[0], yesNoWords);
        if ( n < 0 ) return InputError::INVALID_KEYWORD;
        indexOptions[HEAD_BOUNDS] = n;
        return 0;

    case STATUS_KEY:
        n = Utilities::findMatch(tokens[0], statusWords);
        if ( n < 0 ) return InputError::INVALID_KEYWORD;
        indexOptions[REPORT_STATUS] = (n > 0);
        indexOptions[REPORT_TRIALS] = (n == 2);
        return 0;

    case HEAD_TOL_KEY:
    case FLOW_TOL_KEY:
    case ACCURACY_KEY:
    case MULTIPLIER_KEY:
        if ( !Utilities::parseNumber(tokens[0], x) ) return InputError::INVALID_NUMBER;
        if ( k == MULTIPLIER_KEY )
        {
            if ( x < 0.0 ) return InputError::ILLEGAL_VALUE;
            valueOptions[DEMAND_MULTIPLIER] = x;
            return 0;
        }
        if ( x <= 0.0 ) return InputError::ILLEGAL_VALUE;
        if ( k == HEAD_TOL_KEY ) valueOptions[HEAD_TOLERANCE] = x;
        else if ( k == FLOW_TOL_KEY ) valueOptions[FLOW_TOLERANCE] = x;
        else valueOptions[SOLVER_TOLERANCE] = x;
        return 0;

    default:
        break;
    }

    // ... remaining keywords are time options
    string units = tokens.size() > 1 ? tokens[1] : "";
    seconds = Utilities::getSeconds(tokens[0], units);
    if ( seconds < 0 ) return InputError::INVALID_TIME;
    switch (k)
    {
    case DURATION_KEY:        timeOptions[TOTAL_DURATION] = seconds; break;
    case HYD_STEP_KEY:
        if ( seconds == 0 ) return InputError::ILLEGAL_VALUE;
        timeOptions[HYD_STEP] = seconds;
        break;
    case PATTERN_STEP_KEY:
        if ( seconds == 0 ) return InputError::ILLEGAL_VALUE;
        timeOptions[PATTERN_STEP] = seconds;
        break;
    case PATTERN_START_KEY:   timeOptions[PATTERN_START] = seconds; break;
    case START_CLOCKTIME_KEY: timeOptions[START_TIME] = seconds % 86400; break;
    }
    return 0;
}

//-----------------------------------------------------------------------------

//  Write hydraulic options to a string.

string Options::hydOptionsToStr()
{
    ostringstream s;
    s << left;
    s << setw(24) << "HEADLOSS" << stringOptions[HEADLOSS_MODEL] << "\n";
    s << setw(24) << "SOLVER" << stringOptions[NL_SOLVER] << "\n";
    s << setw(24) << "TRIALS" << indexOptions[MAX_TRIALS] << "\n";
    s << setw(24) << "HEAD BOUNDS" << yesNoWords[indexOptions[HEAD_BOUNDS] ? 1 : 0] << "\n";
    s << setw(24) << "HEAD TOLERANCE" << valueOptions[HEAD_TOLERANCE] << "\n";
    s << setw(24) << "FLOW TOLERANCE" << valueOptions[FLOW_TOLERANCE] << "\n";
    s << setw(24) << "ACCURACY" << valueOptions[SOLVER_TOLERANCE] << "\n";
    s << setw(24) << "DEMAND MULTIPLIER" << valueOptions[DEMAND_MULTIPLIER] << "\n";
    return s.str();
}

//-----------------------------------------------------------------------------

//  Write time options to a string.

string Options::timeOptionsToStr()
{
    ostringstream s;
    s << left;
    s << setw(24) << "DURATION" << Utilities::getTime(timeOptions[TOTAL_DURATION]) << "\n";
    s << setw(24) << "HYDRAULIC TIMESTEP" << Utilities::getTime(timeOptions[HYD_STEP]) << "\n";
    s << setw(24) << "PATTERN TIMESTEP" << Utilities::getTime(timeOptions[PATTERN_STEP]) << "\n";
    s << setw(24) << "PATTERN START" << Utilities::getTime(timeOptions[PATTERN_START]) << "\n";
    s << setw(24) << "START CLOCKTIME" << Utilities::getTime(timeOptions[START_TIME]) << "\n";
    return s.str();
}
