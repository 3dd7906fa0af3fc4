////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "pfs/pixwire/value.hpp"
#include <pfs/countdown_timer.hpp>
#include <pfs/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace tools {

#ifdef DOCTEST_VERSION
// See https://github.com/doctest/doctest/issues/345
inline char const * current_doctest_name ()
{
    return doctest::detail::g_cs->currentTest->m_name;
}
#endif

inline void sleep_ms (int timeout)
{
    std::this_thread::sleep_for(std::chrono::milliseconds{timeout});
}

inline bool wait_atomic_bool (std::atomic_bool & flag
    , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000})
{
    pfs::countdown_timer<std::milli> timer {timelimit};

    while (!flag.load() && timer.remain_count() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds{10});

    return flag.load();
}

template <typename AtomicCounter>
bool wait_atomic_counter (AtomicCounter & counter
    , typename AtomicCounter::value_type limit
    , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000})
{
    pfs::countdown_timer<std::milli> timer {timelimit};

    while (counter.load() < limit && timer.remain_count() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds{10});

    return !(counter.load() < limit);
}

/**
 * Pseudo random (not compressible) bytes, reproducible for the same @a seed.
 */
inline std::vector<char> random_bytes (std::size_t n, std::uint32_t seed = 42)
{
    std::mt19937 gen {seed};
    std::uniform_int_distribution<int> dist {0, 255};
    std::vector<char> result(n);

    for (auto & b: result)
        b = static_cast<char>(dist(gen));

    return result;
}

inline std::vector<char> to_bytes (std::string const & s)
{
    return std::vector<char>(s.begin(), s.end());
}

inline std::string to_string (std::vector<char> const & b)
{
    return std::string(b.begin(), b.end());
}

/**
 * Collects packets delivered from several threads.
 */
class packet_recorder
{
    mutable std::mutex _mtx;
    std::vector<pixwire::packet> _packets;

public:
    void push (pixwire::packet && pkt)
    {
        std::lock_guard<std::mutex> locker{_mtx};
        _packets.push_back(std::move(pkt));
    }

    std::vector<pixwire::packet> packets () const
    {
        std::lock_guard<std::mutex> locker{_mtx};
        return _packets;
    }

    std::vector<pixwire::packet> packets (std::string const & type) const
    {
        std::lock_guard<std::mutex> locker{_mtx};
        std::vector<pixwire::packet> result;

        for (auto const & pkt: _packets) {
            if (pixwire::packet_type(pkt) == type)
                result.push_back(pkt);
        }

        return result;
    }

    std::size_t count (std::string const & type) const
    {
        return packets(type).size();
    }

    bool wait_for (std::string const & type, std::size_t n = 1
        , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000}) const
    {
        pfs::countdown_timer<std::milli> timer {timelimit};

        while (count(type) < n && timer.remain_count() > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds{10});

        return !(count(type) < n);
    }
};

} // namespace tools
