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

PIXWIRE__NAMESPACE_BEGIN

constexpr char const * PROTOCOL_TAG   = "pixwire/protocol";
constexpr char const * CRYPTO_TAG     = "pixwire/crypto";
constexpr char const * CONNECTION_TAG = "pixwire/connection";
constexpr char const * SCHEDULER_TAG  = "pixwire/scheduler";

PIXWIRE__NAMESPACE_END
