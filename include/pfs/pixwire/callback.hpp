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
#include <functional>

PIXWIRE__NAMESPACE_BEGIN

template <typename T>
using callback_t = std::function<T>;

PIXWIRE__NAMESPACE_END
