////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef PIXWIRE__NAMESPACE_NAME
#   define PIXWIRE__NAMESPACE_NAME pixwire
#   define PIXWIRE__NAMESPACE_BEGIN namespace PIXWIRE__NAMESPACE_NAME {
#   define PIXWIRE__NAMESPACE_END }
#endif
