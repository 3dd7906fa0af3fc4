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
#include "bounded_queue.hpp"
#include "callback.hpp"
#include "chunk.hpp"
#include "cipher.hpp"
#include "compression.hpp"
#include "connection.hpp"
#include "engine_config.hpp"
#include "exports.hpp"
#include "frame_parser.hpp"
#include "scheduler.hpp"
#include "serializer.hpp"
#include "value.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

constexpr char const * CONNECTION_LOST = "connection-lost";
constexpr char const * GIBBERISH       = "gibberish";
constexpr char const * INVALID         = "invalid";

enum class protocol_state: std::uint8_t
{
      idle = 0
    , started
    , authenticating
    , open
    , closing
    , closed
};

PIXWIRE__EXPORT char const * to_string (protocol_state state) noexcept;

/**
 * Packet transport over a connection.
 *
 * Four worker threads move data between the application and the connection:
 *   - format: pulls packets from the packet source, encodes them and pushes frames onto the
 *     write queue (started by source_has_more());
 *   - write: writes queued frames to the connection (started on first send);
 *   - read: reads the connection and pushes buffers onto the read queue (started by start());
 *   - parse: feeds the frame parser with queued buffers and dispatches packets (started on
 *     first received data).
 *
 * The write queue is small, so a slow peer blocks the format thread and, through it, the
 * packet source. Events that must not run on the I/O threads (connection-lost, delayed
 * hangups, flush-then-close steps) run on the scheduler.
 *
 * Instances must be owned by std::shared_ptr. The scheduler must outlive the instance and keep
 * running until it is destroyed: worker threads hand their references over to the scheduler, so
 * the last reference is never released on a worker thread.
 */
class protocol: public std::enable_shared_from_this<protocol>
{
public:
    using send_aliases_type = std::map<std::string, std::int64_t>;
    using receive_aliases_type = std::map<std::int64_t, std::string>;

    /**
     * Returns @c false when there is no packet to send. Sets the second argument to @c true
     * if more packets follow.
     */
    using packet_source_type = callback_t<bool (packet &, bool &)>;

private:
    struct write_item
    {
        std::vector<std::vector<char>> buffers;
        bool more {false};
    };

    scheduler & _sched;
    std::unique_ptr<connection> _conn;
    engine_config _config;
    std::atomic<protocol_state> _state {protocol_state::idle};
    std::atomic_bool _closed {false};
    std::atomic_bool _flush_started {false};

    // Inbound
    frame_parser _parser;
    receive_aliases_type _receive_aliases;

    // Outbound, protected by _encoder_mtx
    mutable std::mutex _encoder_mtx;
    serializer const * _serializer {nullptr};
    compressor_enum _compressor {compressor_enum::none};
    int _compression_level {0};
    bool _chunks {true};
    send_aliases_type _send_aliases;
    std::shared_ptr<cipher_state> _cipher_out;

    // Held while packets are encoded and queued, flush_then_close() takes it to stop new
    // packets from being queued
    std::timed_mutex _write_lock;

    bounded_queue<write_item> _write_queue;
    bounded_queue<std::vector<char>> _read_queue; // Empty buffer marks end of stream

    std::mutex _source_mtx;
    std::condition_variable _source_cv;
    packet_source_type _source;
    bool _source_has_more {false};

    std::mutex _threads_mtx;
    std::condition_variable _threads_cv;
    int _running_threads {0};
    std::thread _read_thread;
    std::thread _write_thread;
    std::thread _parse_thread;
    std::thread _format_thread;
    std::atomic_bool _read_alive {false};
    std::atomic_bool _write_alive {false};
    std::atomic_bool _parse_alive {false};
    std::atomic_bool _format_alive {false};

    mutable std::mutex _stats_mtx;
    std::uint64_t _input_packetcount {0};
    std::uint64_t _output_packetcount {0};
    std::map<std::string, std::uint64_t> _input_stats;
    std::map<std::string, std::uint64_t> _output_stats;

public:
    /**
     * Receives every reassembled packet and the synthetic "connection-lost", "gibberish"
     * and "invalid" packets. Regular packets are delivered from the parse thread, synthetic
     * ones from the scheduler.
     */
    mutable callback_t<void (protocol &, packet &&)> on_packet = [] (protocol &, packet &&) {};

public:
    /**
     * @throws error {errc::invalid_argument} if @a config is inconsistent or @a conn is null.
     */
    PIXWIRE__EXPORT protocol (scheduler & sched, std::unique_ptr<connection> conn
        , engine_config config = engine_config{});

    PIXWIRE__EXPORT ~protocol ();

    protocol (protocol const &) = delete;
    protocol & operator = (protocol const &) = delete;

public:
    /**
     * Starts reading the connection.
     */
    PIXWIRE__EXPORT void start ();

    protocol_state state () const noexcept
    {
        return _state.load();
    }

    bool is_closed () const noexcept
    {
        return _closed.load();
    }

    engine_config const & config () const noexcept
    {
        return _config;
    }

    connection & conn () noexcept
    {
        return *_conn;
    }

    /**
     * Handshake with the peer is in progress.
     */
    PIXWIRE__EXPORT void mark_authenticating ();

    /**
     * Handshake completed.
     */
    PIXWIRE__EXPORT void mark_open ();

    /**
     * Registers the pull style packet source used by the format thread.
     */
    PIXWIRE__EXPORT void set_packet_source (packet_source_type source);

    /**
     * Notifies the format thread the packet source has packets to send (starts the thread on
     * first call).
     */
    PIXWIRE__EXPORT void source_has_more ();

    /**
     * Encodes and queues @a pkt from the calling thread.
     *
     * @return @c false if the protocol is closed.
     * @throws error {errc::invalid_argument} if a packet source is registered.
     * @throws error {errc::encoding_error} if the packet can not be encoded.
     */
    PIXWIRE__EXPORT bool send_now (packet pkt);

    /**
     * Queues already framed buffers, bypassing the encoder.
     *
     * @return @c false if the protocol is closed.
     */
    PIXWIRE__EXPORT bool raw_write (std::vector<std::vector<char>> buffers);

    /**
     * Converts @a pkt into the chunks to send with the current settings (aliases applied,
     * no framing, no encryption).
     *
     * @throws error {errc::encoding_error} if the packet can not be encoded.
     */
    PIXWIRE__EXPORT std::vector<chunk> encode (packet pkt) const;

    PIXWIRE__EXPORT void enable_encoder (serializer_enum type);
    PIXWIRE__EXPORT void enable_compressor (compressor_enum c);

    /**
     * @throws error {errc::invalid_argument} if @a level is out of range [0, 10].
     */
    PIXWIRE__EXPORT void set_compression_level (int level);

    PIXWIRE__EXPORT void enable_chunks (bool enable);

    /**
     * Inbound cipher, frames without the cipher flag are rejected afterwards.
     */
    PIXWIRE__EXPORT void set_cipher_in (cipher_params params);

    /**
     * Outbound cipher, applies to frames queued afterwards.
     */
    PIXWIRE__EXPORT void set_cipher_out (cipher_params params);

    /**
     * Numbers to send instead of packet type names (from the peer's capabilities).
     */
    PIXWIRE__EXPORT void set_send_aliases (send_aliases_type aliases);

    /**
     * Numbers the peer may send instead of packet type names.
     */
    PIXWIRE__EXPORT void set_receive_aliases (receive_aliases_type aliases);

    /**
     * Changes the negotiable maximum packet size. Oversized frames are verified against
     * the value current at verification time.
     */
    PIXWIRE__EXPORT void set_max_packet_size (std::size_t n);

    std::size_t max_packet_size () const noexcept
    {
        return _parser.max_packet_size();
    }

    /**
     * Closes the protocol, second and subsequent calls do nothing.
     */
    PIXWIRE__EXPORT void close (std::string const & reason = std::string{});

    /**
     * Tries to write everything queued and then @a last_packet (if not empty), then closes
     * the protocol. Every step is bounded by a timeout, @a done is called on the scheduler
     * when the protocol is closed.
     */
    PIXWIRE__EXPORT void flush_then_close (packet last_packet
        , callback_t<void ()> done = [] () {});

    /**
     * Sends "disconnect" packet with @a reasons and closes the protocol.
     */
    PIXWIRE__EXPORT void send_disconnect (std::vector<std::string> const & reasons
        , callback_t<void ()> done = [] () {});

    /**
     * Settings, counters and thread liveness.
     */
    PIXWIRE__EXPORT value get_info () const;

    /**
     * Negotiated settings to transfer the connection to another protocol instance.
     */
    PIXWIRE__EXPORT value save_state () const;

    /**
     * @throws error {errc::invalid_argument} on malformed state.
     */
    PIXWIRE__EXPORT void restore_state (value const & state);

    /**
     * Waits until all worker threads have finished.
     *
     * @return @c false on timeout.
     */
    PIXWIRE__EXPORT bool wait_for_io_threads_exit (std::chrono::milliseconds timeout);

    /**
     * More frames of the current burst are expected from the peer.
     */
    bool receive_pending () const noexcept
    {
        return _parser.receive_pending();
    }

private:
    void start_thread (std::thread & th, std::atomic_bool & alive, void (protocol::*fn) ()
        , char const * name);
    void ensure_write_thread ();
    void ensure_parse_thread ();
    void ensure_format_thread ();
    void join_threads ();

    void read_loop ();
    void write_loop ();
    void parse_loop ();
    void format_loop ();

    std::shared_ptr<protocol> self_ptr ();
    void defer_release (std::shared_ptr<protocol> && self);
    bool queue_packet (packet && pkt, bool more);
    bool queue_packet_locked (packet && pkt, bool more);
    std::vector<std::vector<char>> make_frames (std::vector<chunk> && chunks, bool more) const;
    void write_buffers (std::vector<std::vector<char>> const & buffers, bool more);

    void dispatch (packet && pkt);
    void gibberish (std::string const & msg, std::vector<char> const & data);
    void invalid (std::string const & msg, std::vector<char> const & data);
    void check_packet_size (std::size_t size, std::vector<char> const & header);
    void shutdown_io ();
    void clean ();
    void may_log_stats ();

    void flush_acquire (packet const & last_packet, callback_t<void ()> done);
    void flush_wait_for_queue (int retries, packet const & last_packet, callback_t<void ()> done);
    void flush_wait_for_packet_sent (clock_type::time_point deadline, callback_t<void ()> done);
    void flush_close_and_release (callback_t<void ()> const & done);
};

PIXWIRE__NAMESPACE_END
