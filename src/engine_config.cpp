////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/engine_config.hpp"
#include "pfs/pixwire/error.hpp"
#include <pfs/i18n.hpp>
#include <cerrno>
#include <cstdlib>
#include <limits>

PIXWIRE__NAMESPACE_BEGIN

namespace {

void throw_invalid (char const * name, std::string const & value)
{
    throw error {
          make_error_code(errc::invalid_argument)
        , tr::f_("bad value for environment variable {}: '{}'", name, value)
    };
}

std::string trim (std::string const & s)
{
    auto first = s.find_first_not_of(" \t");

    if (first == std::string::npos)
        return std::string{};

    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

bool env_string (char const * name, std::string & result)
{
    auto env = std::getenv(name);

    if (env == nullptr)
        return false;

    result = trim(env);
    return true;
}

template <typename T>
bool env_unsigned (char const * name, T & result)
{
    std::string s;

    if (!env_string(name, s))
        return false;

    if (s.empty() || s[0] == '-')
        throw_invalid(name, s);

    char * endp = nullptr;
    errno = 0;
    auto n = std::strtoull(s.c_str(), & endp, 10);

    if (errno != 0 || *endp != '\0' || n > (std::numeric_limits<T>::max)())
        throw_invalid(name, s);

    result = static_cast<T>(n);
    return true;
}

bool env_int (char const * name, int & result)
{
    std::string s;

    if (!env_string(name, s))
        return false;

    char * endp = nullptr;
    errno = 0;
    auto n = std::strtol(s.c_str(), & endp, 10);

    if (s.empty() || errno != 0 || *endp != '\0'
            || n < (std::numeric_limits<int>::min)() || n > (std::numeric_limits<int>::max)()) {
        throw_invalid(name, s);
    }

    result = static_cast<int>(n);
    return true;
}

bool env_millis (char const * name, std::chrono::milliseconds & result)
{
    std::uint32_t n = 0;

    if (!env_unsigned(name, n))
        return false;

    result = std::chrono::milliseconds{n};
    return true;
}

bool parse_bool (std::string const & s, bool & result)
{
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        result = true;
        return true;
    }

    if (s == "0" || s == "false" || s == "no" || s == "off") {
        result = false;
        return true;
    }

    return false;
}

bool env_bool (char const * name, bool & result)
{
    std::string s;

    if (!env_string(name, s))
        return false;

    if (!parse_bool(s, result))
        throw_invalid(name, s);

    return true;
}

std::vector<std::string> split_names (std::string const & s)
{
    std::vector<std::string> result;
    std::string::size_type pos = 0;

    while (pos <= s.size()) {
        auto comma = s.find(',', pos);

        if (comma == std::string::npos)
            comma = s.size();

        auto name = trim(s.substr(pos, comma - pos));

        if (!name.empty())
            result.push_back(std::move(name));

        pos = comma + 1;
    }

    return result;
}

} // namespace

void engine_config::validate () const
{
    auto fail = [] (std::string const & msg) {
        throw error {make_error_code(errc::invalid_argument), msg};
    };

    if (read_buffer_size == 0)
        fail(tr::_("read buffer size must be positive"));

    if (write_queue_capacity == 0 || read_queue_capacity == 0)
        fail(tr::_("queue capacity must be positive"));

    if (abs_max_packet_size == 0)
        fail(tr::_("absolute maximum packet size must be positive"));

    if (max_packet_size > abs_max_packet_size) {
        fail(tr::f_("maximum packet size {} exceeds absolute maximum {}"
            , max_packet_size, abs_max_packet_size));
    }

    if (compression_level < 0 || compression_level > MAX_COMPRESSION_LEVEL) {
        fail(tr::f_("compression level must be in range [0, {}]: {}"
            , MAX_COMPRESSION_LEVEL, compression_level));
    }

    if (flush_queue_retries < 0)
        fail(tr::_("flush queue retries must not be negative"));

    if (enabled_serializers.empty())
        fail(tr::_("no packet serializers enabled"));

    for (auto s: enabled_serializers) {
        if (s == serializer_enum::none)
            fail(tr::_("plain text serializer can not be negotiated"));
    }

    for (auto c: enabled_compressors) {
        if (c == compressor_enum::none)
            fail(tr::_("'none' is not a compressor to enable"));
    }
}

void engine_config::apply_environment (engine_config & config)
{
    if (env_unsigned("PIXWIRE_READ_BUFFER_SIZE", config.read_buffer_size))
        config.packet_join_size = config.read_buffer_size;

    env_unsigned("PIXWIRE_PACKET_JOIN_SIZE", config.packet_join_size);
    env_unsigned("PIXWIRE_LARGE_PACKET_SIZE", config.large_packet_size);
    env_unsigned("PIXWIRE_INLINE_SIZE", config.inline_size);
    env_unsigned("PIXWIRE_MIN_COMPRESS_SIZE", config.min_compress_size);
    env_unsigned("PIXWIRE_MAX_PACKET_SIZE", config.max_packet_size);
    env_unsigned("PIXWIRE_ABS_MAX_PACKET_SIZE", config.abs_max_packet_size);
    env_millis("PIXWIRE_HANGUP_DELAY", config.hangup_delay);
    env_millis("PIXWIRE_INVALID_HANGUP_DELAY", config.invalid_hangup_delay);
    env_millis("PIXWIRE_MAX_PACKET_SIZE_RECHECK_DELAY", config.max_packet_size_recheck_delay);
    env_unsigned("PIXWIRE_WRITE_QUEUE_CAPACITY", config.write_queue_capacity);
    env_unsigned("PIXWIRE_READ_QUEUE_CAPACITY", config.read_queue_capacity);
    env_millis("PIXWIRE_FLUSH_LOCK_TIMEOUT", config.flush_lock_timeout);
    env_millis("PIXWIRE_FLUSH_RETRY_INTERVAL", config.flush_retry_interval);
    env_int("PIXWIRE_FLUSH_QUEUE_RETRIES", config.flush_queue_retries);
    env_millis("PIXWIRE_FLUSH_PACKET_TIMEOUT", config.flush_packet_timeout);
    env_int("PIXWIRE_COMPRESSION_LEVEL", config.compression_level);
    env_bool("PIXWIRE_CHUNKS", config.chunks);
    env_bool("PIXWIRE_USE_ALIASES", config.use_aliases);
    env_bool("PIXWIRE_WAIT_FOR_HEADER", config.wait_for_header);

    std::string s;

    if (env_string("PIXWIRE_LOG_STATS", s)) {
        bool flag = false;

        if (s == "auto")
            config.log_stats = log_stats_mode::automatic;
        else if (parse_bool(s, flag))
            config.log_stats = flag ? log_stats_mode::enabled : log_stats_mode::disabled;
        else
            throw_invalid("PIXWIRE_LOG_STATS", s);
    }

    if (env_string("PIXWIRE_SERIALIZERS", s)) {
        std::vector<serializer_enum> list;

        for (auto const & name: split_names(s)) {
            serializer_enum ser;

            if (!parse_serializer(name, ser) || ser == serializer_enum::none)
                throw_invalid("PIXWIRE_SERIALIZERS", s);

            list.push_back(ser);
        }

        config.enabled_serializers = std::move(list);
    }

    if (env_string("PIXWIRE_COMPRESSORS", s)) {
        std::vector<compressor_enum> list;

        for (auto const & name: split_names(s)) {
            compressor_enum c;

            if (!parse_compressor(name, c))
                throw_invalid("PIXWIRE_COMPRESSORS", s);

            // "none" disables compression
            if (c != compressor_enum::none)
                list.push_back(c);
        }

        config.enabled_compressors = std::move(list);
    }
}

engine_config engine_config::from_environment ()
{
    engine_config config;
    apply_environment(config);
    config.validate();
    return config;
}

char const * to_string (log_stats_mode mode) noexcept
{
    switch (mode) {
        case log_stats_mode::automatic:
            return "auto";
        case log_stats_mode::enabled:
            return "yes";
        case log_stats_mode::disabled:
            return "no";
    }

    return "";
}

PIXWIRE__NAMESPACE_END
