////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/protocol.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/header.hpp"
#include "pfs/pixwire/packet_encoder.hpp"
#include "pfs/pixwire/tag.hpp"
#include "pfs/pixwire/trace.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <exception>
#include <functional>

PIXWIRE__NAMESPACE_BEGIN

namespace {

parser_settings make_parser_settings (engine_config const & config)
{
    parser_settings settings;
    settings.abs_max_packet_size = config.abs_max_packet_size;
    settings.max_packet_size = config.max_packet_size;
    settings.max_decompressed_size = config.abs_max_packet_size;
    settings.wait_for_header = config.wait_for_header;
    return settings;
}

} // namespace

char const * to_string (protocol_state state) noexcept
{
    switch (state) {
        case protocol_state::idle:
            return "idle";
        case protocol_state::started:
            return "started";
        case protocol_state::authenticating:
            return "authenticating";
        case protocol_state::open:
            return "open";
        case protocol_state::closing:
            return "closing";
        case protocol_state::closed:
            return "closed";
    }

    return "";
}

protocol::protocol (scheduler & sched, std::unique_ptr<connection> conn, engine_config config)
    : _sched(sched)
    , _conn(std::move(conn))
    , _config(std::move(config))
    , _parser(make_parser_settings(_config))
    , _compression_level(_config.compression_level)
    , _chunks(_config.chunks)
    , _write_queue(_config.write_queue_capacity)
    , _read_queue(_config.read_queue_capacity)
{
    if (!_conn) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("no connection specified")
        };
    }

    _config.validate();

    _parser.on_packet = [this] (packet && pkt, bool) {
        {
            std::lock_guard<std::mutex> locker{_stats_mtx};
            _input_packetcount++;
            _input_stats[packet_type(pkt)]++;
        }

        dispatch(std::move(pkt));
    };

    _parser.on_gibberish = [this] (std::string const & msg, std::vector<char> const & data) {
        gibberish(msg, data);
    };

    _parser.on_invalid = [this] (std::string const & msg, std::vector<char> const & data) {
        invalid(msg, data);
    };

    // No grace period, most likely the key is wrong
    _parser.on_decryption_error = [this] (std::string const & msg) {
        LOGE(CRYPTO_TAG, "{}", msg);
        close(msg);
    };

    // Negotiation may raise the limit concurrently, verify on the main context later
    _parser.on_oversized = [this] (std::size_t size, std::vector<char> const & header) {
        auto self = self_ptr();

        if (!self)
            return;

        LOGD(PROTOCOL_TAG, "packet size {} exceeds current maximum {}, verification scheduled"
            , size, _parser.max_packet_size());

        _sched.timeout_add(_config.max_packet_size_recheck_delay, [self, size, header] () {
            self->check_packet_size(size, header);
            return false;
        });

        defer_release(std::move(self));
    };
}

protocol::~protocol ()
{
    bool expected = false;

    if (_closed.compare_exchange_strong(expected, true)) {
        _state.store(protocol_state::closed);
        shutdown_io();
    }

    join_threads();
}

std::shared_ptr<protocol> protocol::self_ptr ()
{
    try {
        return shared_from_this();
    } catch (std::bad_weak_ptr const &) {
        // Instance is being destroyed
        return std::shared_ptr<protocol>{};
    }
}

void protocol::defer_release (std::shared_ptr<protocol> && self)
{
    // Destructor joins the worker threads, so they must not release the last reference
    _sched.idle_add(std::bind([] (std::shared_ptr<protocol> const &) {}, std::move(self)));
}

void protocol::start ()
{
    auto expected = protocol_state::idle;

    if (!_state.compare_exchange_strong(expected, protocol_state::started)) {
        LOGW(PROTOCOL_TAG, "protocol already started: {}", to_string(expected));
        return;
    }

    LOGD(PROTOCOL_TAG, "starting protocol: {} -> {} ({})", _conn->local_endpoint()
        , _conn->remote_endpoint(), _conn->socktype());

    start_thread(_read_thread, _read_alive, & protocol::read_loop, "read");
}

void protocol::mark_authenticating ()
{
    auto expected = protocol_state::started;
    _state.compare_exchange_strong(expected, protocol_state::authenticating);
}

void protocol::mark_open ()
{
    auto s = _state.load();

    while (s != protocol_state::closing && s != protocol_state::closed) {
        if (_state.compare_exchange_weak(s, protocol_state::open))
            break;
    }
}

void protocol::start_thread (std::thread & th, std::atomic_bool & alive, void (protocol::*fn) ()
    , char const * name)
{
    std::lock_guard<std::mutex> locker{_threads_mtx};

    if (_closed.load() || th.joinable())
        return;

    ++_running_threads;
    alive.store(true);

    th = std::thread {[this, fn, name, & alive] () {
        LOGD(PROTOCOL_TAG, "{} thread started", name);

        (this->*fn)();

        LOGD(PROTOCOL_TAG, "{} thread finished", name);

        alive.store(false);

        std::lock_guard<std::mutex> locker{_threads_mtx};
        --_running_threads;
        _threads_cv.notify_all();
    }};
}

void protocol::ensure_write_thread ()
{
    start_thread(_write_thread, _write_alive, & protocol::write_loop, "write");
}

void protocol::ensure_parse_thread ()
{
    start_thread(_parse_thread, _parse_alive, & protocol::parse_loop, "parse");
}

void protocol::ensure_format_thread ()
{
    start_thread(_format_thread, _format_alive, & protocol::format_loop, "format");
}

void protocol::join_threads ()
{
    std::vector<std::thread> threads;

    {
        std::lock_guard<std::mutex> locker{_threads_mtx};
        threads.push_back(std::move(_read_thread));
        threads.push_back(std::move(_write_thread));
        threads.push_back(std::move(_parse_thread));
        threads.push_back(std::move(_format_thread));
    }

    // Workers never release the last reference, see dispatch()
    for (auto & th: threads) {
        if (th.joinable())
            th.join();
    }
}

bool protocol::wait_for_io_threads_exit (std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> locker{_threads_mtx};

    return _threads_cv.wait_for(locker, timeout, [this] {
        return _running_threads == 0;
    });
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// Worker threads
////////////////////////////////////////////////////////////////////////////////////////////////////
void protocol::read_loop ()
{
    try {
        while (!_closed.load()) {
            std::vector<char> buf(_config.read_buffer_size);
            auto n = _conn->read(buf.data(), buf.size());

            // Read timeout
            if (n < 0)
                continue;

            if (n == 0) {
                LOGD(PROTOCOL_TAG, "end of stream: {}", _conn->remote_endpoint());
                break;
            }

            buf.resize(static_cast<std::size_t>(n));
            ensure_parse_thread();

            if (!_read_queue.push(std::move(buf)))
                return;
        }
    } catch (std::exception const & ex) {
        if (!_closed.load()) {
            LOGE(PROTOCOL_TAG, "read error: {}", ex.what());
            close(tr::f_("read error: {}", ex.what()));
        }

        return;
    }

    if (!_closed.load()) {
        ensure_parse_thread();
        _read_queue.push(std::vector<char>{});
    }
}

void protocol::parse_loop ()
{
    for (;;) {
        std::vector<char> buf;

        if (!_read_queue.pop(buf))
            break;

        _read_queue.task_done();

        if (buf.empty()) {
            auto self = self_ptr();

            if (self) {
                _sched.idle_add([self] () { self->close(); });
                defer_release(std::move(self));
            }

            break;
        }

        if (_closed.load())
            break;

        try {
            // Stopped by a fatal event, closing is already scheduled
            if (!_parser.feed(buf.data(), buf.size()))
                break;
        } catch (std::exception const & ex) {
            LOGE(PROTOCOL_TAG, "parse error: {}", ex.what());
            close(tr::f_("parse error: {}", ex.what()));
            break;
        }
    }
}

void protocol::write_loop ()
{
    for (;;) {
        write_item item;

        if (!_write_queue.pop(item))
            break;

        try {
            write_buffers(item.buffers, item.more);
        } catch (std::exception const & ex) {
            _write_queue.task_done();

            if (!_closed.load()) {
                LOGE(PROTOCOL_TAG, "write error: {}", ex.what());
                close(tr::f_("write error: {}", ex.what()));
            }

            break;
        }

        _write_queue.task_done();
    }
}

void protocol::format_loop ()
{
    while (!_closed.load()) {
        packet_source_type source;

        {
            std::unique_lock<std::mutex> locker{_source_mtx};

            _source_cv.wait(locker, [this] {
                return _source_has_more || _closed.load();
            });

            if (_closed.load())
                break;

            _source_has_more = false;
            source = _source;
        }

        if (!source)
            continue;

        auto self = self_ptr();

        if (!self)
            break;

        packet pkt;
        bool more = false;
        bool have_packet = false;

        try {
            have_packet = source(pkt, more);
        } catch (std::exception const & ex) {
            LOGE(PROTOCOL_TAG, "packet source failure: {}", ex.what());
            close(tr::f_("packet source failure: {}", ex.what()));
            defer_release(std::move(self));
            break;
        }

        defer_release(std::move(self));

        if (more) {
            std::lock_guard<std::mutex> locker{_source_mtx};
            _source_has_more = true;
        }

        if (!have_packet)
            continue;

        try {
            if (!queue_packet(std::move(pkt), more))
                break;
        } catch (error const & ex) {
            LOGE(PROTOCOL_TAG, "failed to encode packet: {}", ex.what());
            close(tr::f_("failed to encode packet: {}", ex.what()));
            break;
        }
    }
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// Sending
////////////////////////////////////////////////////////////////////////////////////////////////////
void protocol::set_packet_source (packet_source_type source)
{
    std::lock_guard<std::mutex> locker{_source_mtx};
    _source = std::move(source);
}

void protocol::source_has_more ()
{
    {
        std::lock_guard<std::mutex> locker{_source_mtx};
        _source_has_more = true;
    }

    _source_cv.notify_one();
    ensure_format_thread();
}

bool protocol::send_now (packet pkt)
{
    {
        std::lock_guard<std::mutex> locker{_source_mtx};

        if (_source) {
            throw error {
                  make_error_code(errc::invalid_argument)
                , tr::_("send_now() can not be used along with a packet source")
            };
        }
    }

    // Write lock is held by flush_then_close() until the protocol is closed
    if (_flush_started.load())
        return false;

    return queue_packet(std::move(pkt), false);
}

bool protocol::raw_write (std::vector<std::vector<char>> buffers)
{
    if (_closed.load())
        return false;

    write_item item;
    item.buffers = std::move(buffers);
    item.more = false;

    ensure_write_thread();
    return _write_queue.push(std::move(item));
}

bool protocol::queue_packet (packet && pkt, bool more)
{
    std::unique_lock<std::timed_mutex> locker{_write_lock};
    return queue_packet_locked(std::move(pkt), more);
}

bool protocol::queue_packet_locked (packet && pkt, bool more)
{
    if (_closed.load())
        return false;

    auto type = packet_type(pkt);
    auto buffers = make_frames(encode(std::move(pkt)), more);

    {
        std::lock_guard<std::mutex> locker{_stats_mtx};
        _output_packetcount++;
        _output_stats[type]++;
    }

    write_item item;
    item.buffers = std::move(buffers);
    item.more = more;

    ensure_write_thread();
    return _write_queue.push(std::move(item));
}

std::vector<chunk> protocol::encode (packet pkt) const
{
    encoder_settings settings;

    {
        std::lock_guard<std::mutex> locker{_encoder_mtx};

        settings.ser = _serializer;
        settings.compressor = _compressor;
        settings.compression_level = _compression_level;
        settings.chunks = _chunks;

        if (_config.use_aliases && !pkt.empty() && pkt.front().is_string()) {
            auto pos = _send_aliases.find(pkt.front().as_string());

            if (pos != _send_aliases.end())
                pkt.front() = value {pos->second};
        }
    }

    settings.large_packet_size = _config.large_packet_size;
    settings.inline_size = _config.inline_size;
    settings.min_compress_size = _config.min_compress_size;
    settings.large_packets = _config.large_packets;

    return encode_packet(std::move(pkt), settings);
}

std::vector<std::vector<char>> protocol::make_frames (std::vector<chunk> && chunks, bool more) const
{
    std::shared_ptr<cipher_state> cipher;

    {
        std::lock_guard<std::mutex> locker{_encoder_mtx};
        cipher = _cipher_out;
    }

    std::vector<std::vector<char>> items;

    for (auto & c: chunks) {
        // Plain text replies go out as is
        if (c.flags & FLAGS_NOHEADER) {
            items.push_back(std::move(c.data));
            continue;
        }

        auto flags = c.flags;
        auto data = std::move(c.data);

        if (cipher) {
            flags |= FLAGS_CIPHER;
            data = cipher->encrypt(data.data(), data.size());
        }

        if (!more && c.index == 0)
            flags |= FLAGS_FLUSH;

        auto header = pack_header(flags, c.level, c.index, data.size());

        PIXWIRE__TRACE(PROTOCOL_TAG, "frame: flags=0x{:02x}, level=0x{:02x}, index={}, size={}"
            , static_cast<unsigned int>(flags), static_cast<unsigned int>(c.level)
            , static_cast<unsigned int>(c.index), data.size());

        if (data.size() < _config.packet_join_size) {
            std::vector<char> frame;
            frame.reserve(HEADER_SIZE + data.size());
            frame.insert(frame.end(), header.begin(), header.end());
            frame.insert(frame.end(), data.begin(), data.end());
            items.push_back(std::move(frame));
        } else {
            items.emplace_back(header.begin(), header.end());
            items.push_back(std::move(data));
        }
    }

    return items;
}

void protocol::write_buffers (std::vector<std::vector<char>> const & buffers, bool more)
{
    bool multiple = buffers.size() > 1;

    if (more || multiple)
        _conn->set_nodelay(false);

    if (multiple)
        _conn->set_cork(true);

    for (auto const & b: buffers)
        _conn->write_all(b.data(), b.size());

    if (multiple)
        _conn->set_cork(false);

    if (!more)
        _conn->set_nodelay(true);
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// Settings
////////////////////////////////////////////////////////////////////////////////////////////////////
void protocol::enable_encoder (serializer_enum type)
{
    auto const & ser = get_serializer(type);

    std::lock_guard<std::mutex> locker{_encoder_mtx};
    _serializer = & ser;

    LOGD(PROTOCOL_TAG, "packet encoder: {}", ser.name());
}

void protocol::enable_compressor (compressor_enum c)
{
    std::lock_guard<std::mutex> locker{_encoder_mtx};
    _compressor = c;

    LOGD(PROTOCOL_TAG, "compressor: {}", to_string(c));
}

void protocol::set_compression_level (int level)
{
    if (level < 0 || level > MAX_COMPRESSION_LEVEL) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("compression level must be in range [0, {}]: {}", MAX_COMPRESSION_LEVEL, level)
        };
    }

    std::lock_guard<std::mutex> locker{_encoder_mtx};
    _compression_level = level;
}

void protocol::enable_chunks (bool enable)
{
    std::lock_guard<std::mutex> locker{_encoder_mtx};
    _chunks = enable;
}

void protocol::set_cipher_in (cipher_params params)
{
    auto cipher = std::make_shared<cipher_state>(std::move(params), cipher_state::direction::decrypt);
    LOGD(CRYPTO_TAG, "inbound cipher: {}", cipher->name());
    _parser.set_cipher(std::move(cipher));
}

void protocol::set_cipher_out (cipher_params params)
{
    auto cipher = std::make_shared<cipher_state>(std::move(params), cipher_state::direction::encrypt);
    LOGD(CRYPTO_TAG, "outbound cipher: {}", cipher->name());

    std::lock_guard<std::mutex> locker{_encoder_mtx};
    _cipher_out = std::move(cipher);
}

void protocol::set_send_aliases (send_aliases_type aliases)
{
    std::lock_guard<std::mutex> locker{_encoder_mtx};
    _send_aliases = std::move(aliases);
}

void protocol::set_receive_aliases (receive_aliases_type aliases)
{
    {
        std::lock_guard<std::mutex> locker{_encoder_mtx};
        _receive_aliases = aliases;
    }

    _parser.set_receive_aliases(std::move(aliases));
}

void protocol::set_max_packet_size (std::size_t n)
{
    if (n > _config.abs_max_packet_size) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("maximum packet size {} exceeds absolute maximum {}"
                , n, _config.abs_max_packet_size)
        };
    }

    _parser.set_max_packet_size(n);
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// Events
////////////////////////////////////////////////////////////////////////////////////////////////////
void protocol::dispatch (packet && pkt)
{
    // The application may drop its last reference from the callback
    auto self = self_ptr();

    if (!self)
        return;

    auto type = packet_type(pkt);

    try {
        on_packet(*this, std::move(pkt));
    } catch (std::exception const & ex) {
        LOGE(PROTOCOL_TAG, "unhandled error while processing '{}' packet: {}", type, ex.what());
    }

    defer_release(std::move(self));
}

void protocol::gibberish (std::string const & msg, std::vector<char> const & data)
{
    if (_closed.load())
        return;

    auto self = self_ptr();

    if (!self)
        return;

    LOGW(PROTOCOL_TAG, "gibberish received from {}: {}", _conn->remote_endpoint(), msg);

    packet pkt {value{GIBBERISH}, value{msg}, value::make_bytes(data.data(), data.size())};

    _sched.idle_add([self, pkt] () {
        packet copy = pkt;
        self->dispatch(std::move(copy));
    });

    // Delay the hangup to slow down scanners
    _sched.timeout_add(_config.hangup_delay, [self, msg] () {
        self->close(msg);
        return false;
    });

    defer_release(std::move(self));
}

void protocol::invalid (std::string const & msg, std::vector<char> const & data)
{
    if (_closed.load())
        return;

    auto self = self_ptr();

    if (!self)
        return;

    LOGW(PROTOCOL_TAG, "invalid packet received from {}: {}", _conn->remote_endpoint(), msg);

    packet pkt {value{INVALID}, value{msg}, value::make_bytes(data.data(), data.size())};

    _sched.idle_add([self, pkt] () {
        packet copy = pkt;
        self->dispatch(std::move(copy));
    });

    _sched.timeout_add(_config.invalid_hangup_delay, [self, msg] () {
        self->close(msg);
        return false;
    });

    defer_release(std::move(self));
}

void protocol::check_packet_size (std::size_t size, std::vector<char> const & header)
{
    if (_closed.load())
        return;

    auto limit = _parser.max_packet_size();

    if (size <= limit)
        return;

    auto msg = tr::f_("packet size requested is {} but maximum allowed is {}", size, limit);
    LOGE(PROTOCOL_TAG, "{}: {}", make_error_code(errc::packet_too_large).message(), msg);
    invalid(msg, header);
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// Closing
////////////////////////////////////////////////////////////////////////////////////////////////////
void protocol::close (std::string const & reason)
{
    bool expected = false;

    if (!_closed.compare_exchange_strong(expected, true))
        return;

    LOGD(PROTOCOL_TAG, "closing protocol: {}", reason.empty() ? std::string{"<no reason>"} : reason);

    _state.store(protocol_state::closed);

    auto self = self_ptr();

    if (self) {
        packet pkt {value{CONNECTION_LOST}};

        if (!reason.empty())
            pkt.push_back(value{reason});

        _sched.idle_add([self, pkt] () {
            packet copy = pkt;
            self->dispatch(std::move(copy));
        });
    }

    may_log_stats();
    shutdown_io();

    if (self) {
        _sched.idle_add([self] () { self->clean(); });
        defer_release(std::move(self));
    }
}

void protocol::shutdown_io ()
{
    try {
        _conn->close();
    } catch (error const & ex) {
        LOGW(PROTOCOL_TAG, "error closing connection: {}", ex.what());
    }

    // Releases every thread blocked on the queues
    _write_queue.interrupt();
    _read_queue.interrupt();

    std::lock_guard<std::mutex> locker{_source_mtx};
    _source_cv.notify_all();
}

void protocol::clean ()
{
    {
        std::lock_guard<std::mutex> locker{_source_mtx};
        _source = packet_source_type{};
    }

    {
        std::lock_guard<std::mutex> locker{_encoder_mtx};
        _cipher_out.reset();
    }

    _parser.set_cipher(std::shared_ptr<cipher_state>{});
}

void protocol::may_log_stats ()
{
    if (_config.log_stats == log_stats_mode::disabled)
        return;

    std::lock_guard<std::mutex> locker{_stats_mtx};

    if (_config.log_stats == log_stats_mode::automatic
            && _input_packetcount == 0 && _output_packetcount == 0) {
        return;
    }

    LOGI(PROTOCOL_TAG, "connection {} closed: {} packets received ({} bytes), {} packets sent ({} bytes)"
        , _conn->remote_endpoint(), _input_packetcount, _conn->input_bytecount()
        , _output_packetcount, _conn->output_bytecount());
}

void protocol::flush_then_close (packet last_packet, callback_t<void ()> done)
{
    bool expected = false;

    if (!_flush_started.compare_exchange_strong(expected, true)) {
        LOGD(PROTOCOL_TAG, "flush_then_close: already in progress, ignored");
        return;
    }

    auto self = self_ptr();

    if (!self)
        return;

    // All steps run on the scheduler, the write lock is locked and unlocked there
    _sched.idle_add([self, last_packet, done] () {
        self->flush_acquire(last_packet, done);
    });
}

void protocol::flush_acquire (packet const & last_packet, callback_t<void ()> done)
{
    if (_closed.load()) {
        done();
        return;
    }

    auto s = _state.load();

    if (s != protocol_state::closed)
        _state.compare_exchange_strong(s, protocol_state::closing);

    if (!_write_lock.try_lock_for(_config.flush_lock_timeout)) {
        LOGD(PROTOCOL_TAG, "flush_then_close: timeout waiting for the write lock");
        close();
        done();
        return;
    }

    flush_wait_for_queue(_config.flush_queue_retries, last_packet, done);
}

void protocol::flush_wait_for_queue (int retries, packet const & last_packet
    , callback_t<void ()> done)
{
    if (_closed.load()) {
        _write_lock.unlock();
        done();
        return;
    }

    if (!_write_queue.idle()) {
        if (retries <= 0) {
            LOGD(PROTOCOL_TAG, "flush_then_close: queue is still busy, closing without sending"
                " the last packet");
            flush_close_and_release(done);
            return;
        }

        auto self = shared_from_this();

        _sched.timeout_add(_config.flush_retry_interval, [self, retries, last_packet, done] () {
            self->flush_wait_for_queue(retries - 1, last_packet, done);
            return false;
        });

        return;
    }

    if (!last_packet.empty()) {
        LOGD(PROTOCOL_TAG, "flush_then_close: queue is empty, sending the last packet: {}"
            , packet_type(last_packet));

        try {
            packet pkt = last_packet;

            if (!queue_packet_locked(std::move(pkt), false)) {
                flush_close_and_release(done);
                return;
            }
        } catch (error const & ex) {
            LOGE(PROTOCOL_TAG, "flush_then_close: failed to encode the last packet: {}", ex.what());
            flush_close_and_release(done);
            return;
        }
    }

    flush_wait_for_packet_sent(future_timepoint(_config.flush_packet_timeout), done);
}

void protocol::flush_wait_for_packet_sent (clock_type::time_point deadline, callback_t<void ()> done)
{
    if (_closed.load()) {
        _write_lock.unlock();
        done();
        return;
    }

    if (_write_queue.idle()) {
        LOGD(PROTOCOL_TAG, "flush_then_close: everything is written, closing");
        flush_close_and_release(done);
        return;
    }

    if (timepoint_expired(deadline)) {
        LOGD(PROTOCOL_TAG, "flush_then_close: timeout waiting for the last packet to be written");
        flush_close_and_release(done);
        return;
    }

    auto self = shared_from_this();

    _sched.timeout_add(_config.flush_retry_interval, [self, deadline, done] () {
        self->flush_wait_for_packet_sent(deadline, done);
        return false;
    });
}

void protocol::flush_close_and_release (callback_t<void ()> const & done)
{
    close();
    _write_lock.unlock();
    done();
}

void protocol::send_disconnect (std::vector<std::string> const & reasons, callback_t<void ()> done)
{
    packet pkt {value{"disconnect"}};

    for (auto const & r: reasons)
        pkt.push_back(value{r});

    flush_then_close(std::move(pkt), std::move(done));
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// Introspection
////////////////////////////////////////////////////////////////////////////////////////////////////
value protocol::get_info () const
{
    auto info = value::make_dict();

    info.set(value{"type"}, value{_conn->socktype()});
    info.set(value{"endpoint.local"}, value{_conn->local_endpoint()});
    info.set(value{"endpoint.remote"}, value{_conn->remote_endpoint()});
    info.set(value{"state"}, value{to_string(_state.load())});

    {
        std::lock_guard<std::mutex> locker{_encoder_mtx};

        info.set(value{"encoder"}, value{_serializer != nullptr
            ? std::string{_serializer->name()} : std::string{}});
        info.set(value{"compressor"}, value{to_string(_compressor)});
        info.set(value{"compression_level"}, value{_compression_level});
        info.set(value{"chunks"}, value{_chunks});
        info.set(value{"aliases"}, value{_config.use_aliases && !_send_aliases.empty()});
        info.set(value{"cipher.out"}, value{_cipher_out ? _cipher_out->name() : std::string{}});
    }

    auto cipher_in = _parser.cipher();
    info.set(value{"cipher.in"}, value{cipher_in ? cipher_in->name() : std::string{}});

    info.set(value{"max_packet_size"}, value{_parser.max_packet_size()});
    info.set(value{"abs_max_packet_size"}, value{_config.abs_max_packet_size});
    info.set(value{"large_packet_size"}, value{_config.large_packet_size});
    info.set(value{"inline_size"}, value{_config.inline_size});
    info.set(value{"min_compress_size"}, value{_config.min_compress_size});
    info.set(value{"read_buffer_size"}, value{_config.read_buffer_size});
    info.set(value{"packet_join_size"}, value{_config.packet_join_size});
    info.set(value{"receive_pending"}, value{_parser.receive_pending()});
    info.set(value{"write_queue.size"}, value{_write_queue.size()});
    info.set(value{"read_queue.size"}, value{_read_queue.size()});
    info.set(value{"input.bytecount"}, value{_conn->input_bytecount()});
    info.set(value{"output.bytecount"}, value{_conn->output_bytecount()});

    {
        std::lock_guard<std::mutex> locker{_stats_mtx};

        info.set(value{"input.packetcount"}, value{_input_packetcount});
        info.set(value{"output.packetcount"}, value{_output_packetcount});

        auto input_packets = value::make_dict();
        auto output_packets = value::make_dict();

        for (auto const & x: _input_stats)
            input_packets.set(value{x.first}, value{x.second});

        for (auto const & x: _output_stats)
            output_packets.set(value{x.first}, value{x.second});

        info.set(value{"input.packets"}, std::move(input_packets));
        info.set(value{"output.packets"}, std::move(output_packets));
    }

    auto threads = value::make_dict();
    threads.set(value{"read"}, value{_read_alive.load()});
    threads.set(value{"write"}, value{_write_alive.load()});
    threads.set(value{"parse"}, value{_parse_alive.load()});
    threads.set(value{"format"}, value{_format_alive.load()});
    info.set(value{"threads"}, std::move(threads));

    return info;
}

value protocol::save_state () const
{
    auto state = value::make_dict();
    auto send_aliases = value::make_dict();
    auto receive_aliases = value::make_dict();

    std::lock_guard<std::mutex> locker{_encoder_mtx};

    state.set(value{"serializer"}, value{_serializer != nullptr
        ? std::string{_serializer->name()} : std::string{}});
    state.set(value{"compressor"}, value{to_string(_compressor)});
    state.set(value{"compression_level"}, value{_compression_level});
    state.set(value{"chunks"}, value{_chunks});
    state.set(value{"max_packet_size"}, value{_parser.max_packet_size()});

    for (auto const & x: _send_aliases)
        send_aliases.set(value{x.first}, value{x.second});

    for (auto const & x: _receive_aliases)
        receive_aliases.set(value{x.first}, value{x.second});

    state.set(value{"send_aliases"}, std::move(send_aliases));
    state.set(value{"receive_aliases"}, std::move(receive_aliases));

    return state;
}

void protocol::restore_state (value const & state)
{
    if (!state.is_dict()) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("protocol state must be a dictionary")
        };
    }

    auto v = state.find("serializer");

    if (v != nullptr && v->size() > 0) {
        serializer_enum ser;

        if (!parse_serializer(v->to_text(), ser)) {
            throw error {
                  make_error_code(errc::invalid_argument)
                , tr::f_("unknown serializer: {}", v->to_text())
            };
        }

        enable_encoder(ser);
    }

    v = state.find("compressor");

    if (v != nullptr) {
        compressor_enum c;

        if (!parse_compressor(v->to_text(), c)) {
            throw error {
                  make_error_code(errc::invalid_argument)
                , tr::f_("unknown compressor: {}", v->to_text())
            };
        }

        enable_compressor(c);
    }

    v = state.find("compression_level");

    if (v != nullptr)
        set_compression_level(static_cast<int>(v->as_integer()));

    v = state.find("chunks");

    if (v != nullptr)
        enable_chunks(v->as_boolean());

    v = state.find("max_packet_size");

    if (v != nullptr)
        set_max_packet_size(static_cast<std::size_t>(v->as_integer()));

    v = state.find("send_aliases");

    if (v != nullptr) {
        send_aliases_type aliases;

        for (auto const & x: v->as_dict())
            aliases[x.first.to_text()] = x.second.as_integer();

        set_send_aliases(std::move(aliases));
    }

    v = state.find("receive_aliases");

    if (v != nullptr) {
        receive_aliases_type aliases;

        for (auto const & x: v->as_dict())
            aliases[x.first.as_integer()] = x.second.to_text();

        set_receive_aliases(std::move(aliases));
    }
}

PIXWIRE__NAMESPACE_END
