////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/frame_parser.hpp"
#include "pfs/pixwire/compression.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/gibberish.hpp"
#include "pfs/pixwire/serializer.hpp"
#include "pfs/pixwire/tag.hpp"
#include "pfs/pixwire/trace.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>

PIXWIRE__NAMESPACE_BEGIN

frame_parser::frame_parser (parser_settings const & settings)
    : _settings(settings)
    , _max_packet_size(settings.max_packet_size)
{}

void frame_parser::set_cipher (std::shared_ptr<cipher_state> cipher)
{
    std::lock_guard<std::mutex> locker{_mtx};
    _cipher = std::move(cipher);
}

std::shared_ptr<cipher_state> frame_parser::cipher () const
{
    std::lock_guard<std::mutex> locker{_mtx};
    return _cipher;
}

void frame_parser::set_receive_aliases (aliases_type aliases)
{
    std::lock_guard<std::mutex> locker{_mtx};
    _aliases = std::move(aliases);
}

bool frame_parser::feed (char const * data, std::size_t n)
{
    if (_failed)
        return false;

    _buffer.append(data, n);

    if (_settings.wait_for_header) {
        auto pos = find_marker(_buffer.data(), _buffer.size(), _settings.abs_max_packet_size);

        if (pos < 0) {
            // Only the tail may still become the start of a header
            if (_buffer.size() >= HEADER_SIZE) {
                auto skip = _buffer.size() - (HEADER_SIZE - 1);
                LOGD(PROTOCOL_TAG, "waiting for header: {} bytes skipped", skip);
                _buffer.erase_front(skip);
            }

            return true;
        }

        LOGD(PROTOCOL_TAG, "header found after {} bytes", pos);
        _buffer.erase_front(static_cast<std::size_t>(pos));
        _settings.wait_for_header = false;
    }

    while (!_buffer.empty()) {
        if (!_have_header) {
            if (_buffer.size() < HEADER_SIZE && _buffer[0] == HEADER_MARKER)
                break; // Header is still incomplete

            if (!parse_header())
                return false;

            // Consumed header, continue with payload
        }

        if (_buffer.size() < _header.size)
            break; // Wait for the rest of the payload

        auto payload = _buffer.take_front(_header.size);
        _have_header = false;

        if (!process_frame(_header, std::move(payload)))
            return false;
    }

    // Zero length frame at the end of the buffer
    if (_have_header && _header.size == 0) {
        _have_header = false;
        return process_frame(_header, std::vector<char>{});
    }

    return true;
}

bool frame_parser::parse_header ()
{
    if (_buffer[0] != HEADER_MARKER) {
        return invalid_header(_buffer.data(), _buffer.size()
            , tr::f_("invalid packet header byte 0x{:02x}"
                , static_cast<unsigned int>(static_cast<std::uint8_t>(_buffer[0]))));
    }

    auto h = unpack_header(_buffer.data(), _buffer.size());

    // Checked before anything is allocated for the payload
    if (h.size > _settings.abs_max_packet_size) {
        return invalid_header(_buffer.data(), HEADER_SIZE
            , tr::f_("invalid size in packet header: {}", h.size));
    }

    if (h.index > MAX_CHUNK_INDEX) {
        return invalid_header(_buffer.data(), HEADER_SIZE
            , tr::f_("invalid packet index: {}", static_cast<unsigned int>(h.index)));
    }

    if (h.has_cipher() && !cipher()) {
        LOGW(CRYPTO_TAG, "received cipher block, but we don't have a cipher to decrypt it with");
        return invalid_header(_buffer.data(), HEADER_SIZE
            , tr::_("invalid encryption packet flag (no cipher configured)"));
    }

    if (h.size > _max_packet_size.load()) {
        std::vector<char> header_bytes(_buffer.data(), _buffer.data() + HEADER_SIZE);
        on_oversized(h.size, header_bytes);
    }

    _buffer.erase_front(HEADER_SIZE);
    _header = h;
    _have_header = true;

    PIXWIRE__TRACE(PROTOCOL_TAG, "header: flags=0x{:02x}, level=0x{:02x}, index={}, size={}"
        , static_cast<unsigned int>(h.flags), static_cast<unsigned int>(h.level)
        , static_cast<unsigned int>(h.index), h.size);

    return true;
}

bool frame_parser::process_frame (frame_header const & h, std::vector<char> && payload)
{
    std::vector<char> data = std::move(payload);
    auto cipher_in = cipher();

    if (cipher_in) {
        if (!h.has_cipher())
            return fail_invalid(tr::_("unencrypted packet dropped"), data);

        try {
            data = cipher_in->decrypt(data.data(), data.size());
        } catch (error const & ex) {
            LOGE(CRYPTO_TAG, "{}", ex.what());
            _failed = true;
            _buffer.clear();
            on_decryption_error(tr::f_("encryption error (wrong key?): {}", ex.what()));
            return false;
        }
    }

    if (h.level > 0) {
        try {
            data = decompress(data.data(), data.size(), h.level, _settings.max_decompressed_size);
        } catch (error const & ex) {
            if (ex.code() == make_error_code(errc::invalid_compression))
                return fail_invalid(tr::f_("invalid compression: {}", ex.what()), data);

            auto msg = tr::f_("{} packet decompression failed", compression_type(h.level));

            // Exception text may leak crypto information
            if (cipher_in)
                msg += tr::_(" (invalid encryption key?)");
            else
                msg += tr::f_(" {}", ex.what());

            return fail_gibberish(msg, data);
        }
    }

    if (h.index > 0) {
        try {
            _assembler.add(h.index, std::move(data));
        } catch (error const & ex) {
            return fail_invalid(ex.what(), std::vector<char>{});
        }

        // Main chunk follows immediately
        _receive_pending = true;
        return true;
    }

    packet pkt;

    try {
        auto const & ser = serializer_for_flags(h.flags);
        pkt = ser.decode(data.data(), data.size());
    } catch (error const & ex) {
        _assembler.clear();
        return fail_invalid(tr::f_("invalid packet encoding: {}", ex.what()), data);
    }

    if (pkt.empty())
        return fail_invalid(tr::_("empty packet"), data);

    if (pkt.front().is_integer()) {
        std::unique_lock<std::mutex> locker{_mtx};
        auto pos = _aliases.find(pkt.front().as_integer());

        if (pos == _aliases.end()) {
            locker.unlock();
            return fail_invalid(tr::f_("unknown packet type alias: {}"
                , pkt.front().as_integer()), data);
        }

        pkt.front() = value {pos->second};
    } else if (pkt.front().is_bytes()) {
        pkt.front() = value {pkt.front().to_text()};
    } else if (!pkt.front().is_string()) {
        return fail_invalid(tr::f_("invalid packet type: {}", to_string(pkt.front())), data);
    }

    try {
        _assembler.splice(pkt);
    } catch (error const & ex) {
        return fail_invalid(ex.what(), data);
    }

    _receive_pending = !h.has_flush();
    on_packet(std::move(pkt), h.has_flush());
    return true;
}

bool frame_parser::invalid_header (char const * data, std::size_t n, std::string const & msg)
{
    LOGD(PROTOCOL_TAG, "invalid header ({} bytes): {}", n, msg);
    std::vector<char> bytes(data, data + n);
    return fail_gibberish(describe_invalid_header(data, n, msg), bytes);
}

bool frame_parser::fail_invalid (std::string const & msg, std::vector<char> const & data)
{
    _failed = true;
    _buffer.clear();
    _assembler.clear();
    on_invalid(msg, data);
    return false;
}

bool frame_parser::fail_gibberish (std::string const & msg, std::vector<char> const & data)
{
    _failed = true;
    _buffer.clear();
    _assembler.clear();
    on_gibberish(msg, data);
    return false;
}

PIXWIRE__NAMESPACE_END
