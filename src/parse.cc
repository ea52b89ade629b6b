// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "parse.h"

#include <ostream>

const char* dactyl::Name(ParseError error)
{
    switch (error)
    {
    case ParseError::none:
        return "none";
    case ParseError::empty:
        return "empty";
    case ParseError::invalid_digit:
        return "invalid digit";
    case ParseError::overflow:
        return "overflow";
    }
    return "unknown";
}

std::ostream& dactyl::operator<<(std::ostream& os, ParseError error)
{
    return os << Name(error);
}
