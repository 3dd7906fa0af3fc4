////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef PIXWIRE__STATIC
#   ifndef PIXWIRE__EXPORT
#       if _MSC_VER
#           if defined(PIXWIRE__EXPORTS)
#               define PIXWIRE__EXPORT __declspec(dllexport)
#           else
#               define PIXWIRE__EXPORT __declspec(dllimport)
#           endif
#       else
#           define PIXWIRE__EXPORT
#       endif
#   endif
#else
#   define PIXWIRE__EXPORT
#endif // !PIXWIRE__STATIC
