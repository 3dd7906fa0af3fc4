////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#if PIXWIRE__TRACE_ENABLED
#   include <pfs/fmt.hpp>
#   include <cstdio>
#   define PIXWIRE__TRACE(t, f, ...) {                                         \
        fmt::print(stdout, "[T] {}: " f "\n", t , ##__VA_ARGS__); fflush(stdout);}
#else // PIXWIRE__TRACE_ENABLED
#   define PIXWIRE__TRACE(t, f, ...)
#endif // !PIXWIRE__TRACE_ENABLED
