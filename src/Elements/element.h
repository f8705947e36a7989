/* EPANET 3.1.1 Pressure Management Extension
 *
 * Copyright (c) 2016 Open Water Analytics
 * Licensed under the terms of the MIT License (see the LICENSE file for details).
 *
 */

//! \file element.h
//! \brief Describes the Element class.

#ifndef ELEMENT_H_
#define ELEMENT_H_

#include <string>

//! \class Element
//! \brief Abstract parent class of all network components.

class Element
{
  public:

    enum ElementType {NODE, LINK, PATTERN, CONTROL};

    Element(std::string name_) : name(name_), index(-1) {}
    virtual ~Element() {}

    std::string name;      //!< element's ID name
    int         index;     //!< element's position in its network collection
};

#endif
