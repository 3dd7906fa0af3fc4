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
#include "compression.hpp"
#include "exports.hpp"
#include "serializer.hpp"
#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

enum class log_stats_mode: std::uint8_t
{
      automatic = 0 // Log unless nothing was transferred
    , enabled
    , disabled
};

/**
 * Protocol engine settings.
 */
struct engine_config
{
    std::size_t read_buffer_size {65536};

    // Header and payload below this size are written as one buffer
    std::size_t packet_join_size {65536};

    std::size_t large_packet_size {16384};
    std::size_t inline_size {32768};
    std::size_t min_compress_size {378};
    std::size_t max_packet_size {16 * 1024 * 1024};
    std::uint32_t abs_max_packet_size {256 * 1024 * 1024};

    std::chrono::milliseconds hangup_delay {1000};
    std::chrono::milliseconds invalid_hangup_delay {1000};

    // Delay of the oversized packet verification on the main context
    std::chrono::milliseconds max_packet_size_recheck_delay {1000};

    std::size_t write_queue_capacity {1};
    std::size_t read_queue_capacity {20};

    std::chrono::milliseconds flush_lock_timeout {100};
    std::chrono::milliseconds flush_retry_interval {100};
    int flush_queue_retries {10};
    std::chrono::milliseconds flush_packet_timeout {5000};

    int compression_level {1};
    bool chunks {true};
    bool use_aliases {true};
    log_stats_mode log_stats {log_stats_mode::automatic};

    // Skip leading bytes until a frame header is found
    bool wait_for_header {false};

    // Preference order
    std::vector<serializer_enum> enabled_serializers {serializer_enum::rencodeplus
        , serializer_enum::bencode};
    std::vector<compressor_enum> enabled_compressors {compressor_enum::zlib, compressor_enum::lz4};

    // Packet types that are expected to be large
    std::set<std::string> large_packets {"hello", "window-metadata", "sound-data"
        , "notify_show", "setting-change", "shell-reply", "configure-display"};

public:
    /**
     * Checks settings consistency.
     *
     * @throws error {errc::invalid_argument} on inconsistent settings.
     */
    PIXWIRE__EXPORT void validate () const;

    /**
     * Returns default settings overridden by PIXWIRE_* environment variables.
     *
     * @throws error {errc::invalid_argument} on malformed values.
     */
    static PIXWIRE__EXPORT engine_config from_environment ();

    /**
     * Applies PIXWIRE_* environment variables to @a config.
     *
     * @throws error {errc::invalid_argument} on malformed values.
     */
    static PIXWIRE__EXPORT void apply_environment (engine_config & config);
};

PIXWIRE__EXPORT char const * to_string (log_stats_mode mode) noexcept;

PIXWIRE__NAMESPACE_END
