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
#include <atomic>

PIXWIRE__NAMESPACE_BEGIN

class interruptable
{
private:
    std::atomic_bool _interrupted {false};

public:
    virtual ~interruptable () {}

public:
    virtual void interrupt ()
    {
        _interrupted.store(true);
    }

    bool interrupted () const noexcept
    {
        return _interrupted.load();
    }
};

PIXWIRE__NAMESPACE_END
