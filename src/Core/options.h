/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Distributed under the MIT License (see the LICENSE file for details).
 *
 */

 //! \file options.h
 //! \brief Describes the Options class.

#ifndef OPTIONS_H_
#define OPTIONS_H_

#include <string>

//! \class Options
//! \brief User-supplied options for analyzing a pipe network.

class Options
{
  public:

    // String options
    enum StringOption {
        HEADLOSS_MODEL, NL_SOLVER,
        MAX_STRING_OPTIONS
    };

    // Integer or categorical options
    enum IndexOption {
        MAX_TRIALS, HEAD_BOUNDS, REPORT_STATUS, REPORT_TRIALS,
        MAX_INDEX_OPTIONS
    };

    // Numerical value options
    enum ValueOption {
        HEAD_TOLERANCE, FLOW_TOLERANCE, SOLVER_TOLERANCE, DEMAND_MULTIPLIER,
        MAX_VALUE_OPTIONS
    };

    // Time-based options
    enum TimeOption {
        START_TIME, HYD_STEP, PATTERN_STEP, PATTERN_START, TOTAL_DURATION,
        MAX_TIME_OPTIONS
    };

    Options();
    ~Options() {}

    // Getter methods for options
    std::string stringOption(StringOption option);
    int         indexOption(IndexOption option);
    double      valueOption(ValueOption option);
    int         timeOption(TimeOption option);

    // Setter methods for options
    void setDefaults();
    int  setOption(StringOption option, const std::string& value);
    void setOption(IndexOption option, int value);
    void setOption(ValueOption option, double value);
    void setOption(TimeOption option, int value);
    int  setOption(const std::string& keyword, const std::string& value);

    // Methods for converting options to strings
    std::string hydOptionsToStr();
    std::string timeOptionsToStr();

  private:
    std::string  stringOptions[MAX_STRING_OPTIONS];
    int          indexOptions[MAX_INDEX_OPTIONS];
    double       valueOptions[MAX_VALUE_OPTIONS];
    int          timeOptions[MAX_TIME_OPTIONS];
};

//-----------------------------------------------------------------------------
// Inline Functions
//-----------------------------------------------------------------------------

inline std::string Options::stringOption(StringOption option)
{
    return stringOptions[option];
}

inline int Options::indexOption(IndexOption option)
{
    return indexOptions[option];
}

inline double Options::valueOption(ValueOption option)
{
    return valueOptions[option];
}

inline int Options::timeOption(TimeOption option)
{
    return timeOptions[option];
}

#endif // OPTIONS_H_
