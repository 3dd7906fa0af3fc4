////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <chrono>

PIXWIRE__NAMESPACE_BEGIN

using clock_type = std::chrono::steady_clock;

inline clock_type::time_point current_timepoint ()
{
    return clock_type::now();
}

inline clock_type::time_point future_timepoint (std::chrono::milliseconds increment)
{
    return current_timepoint() + increment;
}

inline bool timepoint_expired (clock_type::time_point sample)
{
    return current_timepoint() > sample;
}

PIXWIRE__NAMESPACE_END
