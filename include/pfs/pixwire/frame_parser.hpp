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
#include "archive.hpp"
#include "callback.hpp"
#include "chunk_assembler.hpp"
#include "cipher.hpp"
#include "exports.hpp"
#include "header.hpp"
#include "value.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

struct parser_settings
{
    std::uint32_t abs_max_packet_size {256 * 1024 * 1024};
    std::size_t max_packet_size {16 * 1024 * 1024};

    // Limit for decompressed payloads
    std::size_t max_decompressed_size {256 * 1024 * 1024};

    // Skip leading bytes until something that looks like a first frame header
    bool wait_for_header {false};
};

/**
 * Byte level state machine of the receiving side.
 *
 * Accumulates bytes until a full header and payload are available, then decrypts,
 * decompresses, buffers raw chunks, decodes the main chunk, splices raw chunks into the
 * decoded packet and delivers it. Frames may span several feeds and one feed may carry
 * several frames.
 *
 * Any fatal event (gibberish, invalid, decryption error) stops the parser: further input is
 * ignored. Oversized frames are reported but parsing goes on, the final decision is up to
 * the owner.
 */
class frame_parser
{
public:
    using aliases_type = std::map<std::int64_t, std::string>;

private:
    parser_settings _settings;
    std::atomic<std::size_t> _max_packet_size;
    archive _buffer;
    frame_header _header;
    bool _have_header {false};
    std::atomic_bool _failed {false};         // Read from the owner threads
    std::atomic_bool _receive_pending {false};
    chunk_assembler _assembler;

    mutable std::mutex _mtx; // Protects cipher and aliases
    std::shared_ptr<cipher_state> _cipher;
    aliases_type _aliases;

public:
    /**
     * Complete packet received. Second argument is the flush hint of the main chunk.
     */
    mutable callback_t<void (packet &&, bool)> on_packet = [] (packet &&, bool) {};

    /**
     * Input is not this protocol at all.
     */
    mutable callback_t<void (std::string const &, std::vector<char> const &)> on_gibberish
        = [] (std::string const &, std::vector<char> const &) {};

    /**
     * Structurally valid frame with malformed content.
     */
    mutable callback_t<void (std::string const &, std::vector<char> const &)> on_invalid
        = [] (std::string const &, std::vector<char> const &) {};

    /**
     * Frame can not be decrypted (wrong key or corrupted data).
     */
    mutable callback_t<void (std::string const &)> on_decryption_error = [] (std::string const &) {};

    /**
     * Declared frame size exceeds the current maximum packet size. Arguments are the size and
     * the header bytes.
     */
    mutable callback_t<void (std::size_t, std::vector<char> const &)> on_oversized
        = [] (std::size_t, std::vector<char> const &) {};

public:
    PIXWIRE__EXPORT frame_parser (parser_settings const & settings = parser_settings{});

    frame_parser (frame_parser const &) = delete;
    frame_parser & operator = (frame_parser const &) = delete;

public:
    /**
     * Feeds received bytes.
     *
     * @return @c false if parser is stopped by a fatal event.
     */
    PIXWIRE__EXPORT bool feed (char const * data, std::size_t n);

    bool failed () const noexcept
    {
        return _failed.load();
    }

    /**
     * Number of buffered bytes not yet consumed.
     */
    std::size_t buffered () const noexcept
    {
        return _buffer.size();
    }

    /**
     * More data of the current burst is expected (last frame had no flush hint or was a raw
     * chunk).
     */
    bool receive_pending () const noexcept
    {
        return _receive_pending.load();
    }

    bool waiting_for_header () const noexcept
    {
        return _settings.wait_for_header;
    }

    std::size_t max_packet_size () const noexcept
    {
        return _max_packet_size.load();
    }

    void set_max_packet_size (std::size_t n) noexcept
    {
        _max_packet_size.store(n);
    }

    PIXWIRE__EXPORT void set_cipher (std::shared_ptr<cipher_state> cipher);
    PIXWIRE__EXPORT std::shared_ptr<cipher_state> cipher () const;

    /**
     * Sets the table used to translate packet type numbers back into names.
     */
    PIXWIRE__EXPORT void set_receive_aliases (aliases_type aliases);

private:
    bool parse_header ();
    bool process_frame (frame_header const & h, std::vector<char> && data);
    bool invalid_header (char const * data, std::size_t n, std::string const & msg);
    bool fail_invalid (std::string const & msg, std::vector<char> const & data);
    bool fail_gibberish (std::string const & msg, std::vector<char> const & data);
};

PIXWIRE__NAMESPACE_END
