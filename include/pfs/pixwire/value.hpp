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
#include "exports.hpp"
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

enum class value_kind: std::uint8_t
{
      null = 0
    , integer
    , boolean
    , string
    , bytes
    , list
    , dict
    , compressed      // Already compressed data (pixels, cursors, ...)
    , compressible    // Raw data to be compressed at send time
    , large_structure // Nested value that is allowed to be big
};

/**
 * Packet item.
 *
 * Dictionary entries are kept sorted by key, so two dictionaries with the same content
 * always compare equal and serialize identically.
 */
class value
{
public:
    using bytes_type = std::vector<char>;
    using list_type  = std::vector<value>;
    using dict_type  = std::vector<std::pair<value, value>>;

private:
    value_kind _kind {value_kind::null};
    std::int64_t _int {0};
    std::string _str;   // string or datatype of the wrappers
    bytes_type _bytes;  // bytes, compressed, compressible
    list_type _list;    // list or the single wrapped value of large_structure
    dict_type _dict;

    // Compressed wrapper
    std::uint8_t _level {0};
    bool _can_inline {false};
    bool _level_compressed {false};

public:
    value () = default;

    value (bool b)
        : _kind(value_kind::boolean)
        , _int(b ? 1 : 0)
    {}

    template <typename T
        , typename = typename std::enable_if<std::is_integral<T>::value
            && !std::is_same<T, bool>::value
            && !std::is_same<T, char>::value>::type>
    value (T n)
        : _kind(value_kind::integer)
        , _int(static_cast<std::int64_t>(n))
    {}

    value (char const * s)
        : _kind(value_kind::string)
        , _str(s)
    {}

    value (std::string s)
        : _kind(value_kind::string)
        , _str(std::move(s))
    {}

    value (bytes_type b)
        : _kind(value_kind::bytes)
        , _bytes(std::move(b))
    {}

    value (list_type l)
        : _kind(value_kind::list)
        , _list(std::move(l))
    {}

public:
    static value make_bytes (char const * data, std::size_t n)
    {
        return value {bytes_type(data, data + n)};
    }

    static value make_bytes (std::string const & s)
    {
        return make_bytes(s.data(), s.size());
    }

    static value make_list (list_type l)
    {
        return value {std::move(l)};
    }

    /**
     * Makes dictionary, sorts entries by key.
     */
    PIXWIRE__EXPORT static value make_dict (dict_type d = dict_type{});

    /**
     * Makes wrapper for already compressed data.
     *
     * @param level Compression level byte when @a data was compressed by a codec the network
     *        layer understands (level compressed), zero otherwise.
     * @param can_inline Data may travel inside the main packet when it is small enough.
     */
    PIXWIRE__EXPORT static value make_compressed (std::string datatype, bytes_type data
        , std::uint8_t level = 0, bool can_inline = false);

    PIXWIRE__EXPORT static value make_compressible (std::string datatype, bytes_type data);

    PIXWIRE__EXPORT static value make_large_structure (std::string datatype, value v);

public:
    value_kind kind () const noexcept { return _kind; }

    bool is_null () const noexcept { return _kind == value_kind::null; }
    bool is_integer () const noexcept { return _kind == value_kind::integer; }
    bool is_boolean () const noexcept { return _kind == value_kind::boolean; }
    bool is_string () const noexcept { return _kind == value_kind::string; }
    bool is_bytes () const noexcept { return _kind == value_kind::bytes; }
    bool is_list () const noexcept { return _kind == value_kind::list; }
    bool is_dict () const noexcept { return _kind == value_kind::dict; }
    bool is_compressed () const noexcept { return _kind == value_kind::compressed; }
    bool is_compressible () const noexcept { return _kind == value_kind::compressible; }
    bool is_large_structure () const noexcept { return _kind == value_kind::large_structure; }

    /**
     * @throws error {errc::invalid_argument} on kind mismatch (same for all accessors below).
     */
    PIXWIRE__EXPORT std::int64_t as_integer () const;
    PIXWIRE__EXPORT bool as_boolean () const;
    PIXWIRE__EXPORT std::string const & as_string () const;

    /**
     * Byte content of bytes, compressed and compressible values.
     */
    PIXWIRE__EXPORT bytes_type const & as_bytes () const;
    PIXWIRE__EXPORT bytes_type & as_bytes ();

    PIXWIRE__EXPORT list_type const & as_list () const;
    PIXWIRE__EXPORT list_type & as_list ();
    PIXWIRE__EXPORT dict_type const & as_dict () const;

    /**
     * Wrapped value of the large structure.
     */
    PIXWIRE__EXPORT value const & inner () const;

    std::string const & datatype () const noexcept { return _str; }
    std::uint8_t level () const noexcept { return _level; }
    bool can_inline () const noexcept { return _can_inline; }
    bool level_compressed () const noexcept { return _level_compressed; }

    /**
     * Size in bytes of the string/binary content, number of elements for containers.
     */
    PIXWIRE__EXPORT std::size_t size () const noexcept;

    /**
     * Looks up dictionary entry by string key (byte string keys match too).
     *
     * @return Pointer to value or @c nullptr if not found or value is not a dictionary.
     */
    PIXWIRE__EXPORT value const * find (std::string const & key) const noexcept;

    /**
     * Inserts or replaces dictionary entry keeping the key order.
     */
    PIXWIRE__EXPORT void set (value key, value v);

    /**
     * Text of a string or a byte string value.
     */
    PIXWIRE__EXPORT std::string to_text () const;

public:
    PIXWIRE__EXPORT friend int compare (value const & a, value const & b) noexcept;

    friend bool operator == (value const & a, value const & b) noexcept
    {
        return compare(a, b) == 0;
    }

    friend bool operator != (value const & a, value const & b) noexcept
    {
        return compare(a, b) != 0;
    }

    friend bool operator < (value const & a, value const & b) noexcept
    {
        return compare(a, b) < 0;
    }
};

using packet = value::list_type;

/**
 * Debug rendering, long strings and binary data are ellipsized to @a limit characters.
 */
PIXWIRE__EXPORT std::string to_string (value const & v, std::size_t limit = 256);
PIXWIRE__EXPORT std::string to_string (packet const & pkt, std::size_t limit = 256);

/**
 * Packet type (string or alias number) as text.
 */
PIXWIRE__EXPORT std::string packet_type (packet const & pkt);

/**
 * Checks the packet is transmittable.
 *
 * @throws error {errc::encoding_error} if the packet is empty, the type slot is neither
 *         a string nor an integer, or a null value occurs at any depth.
 */
PIXWIRE__EXPORT void validate_packet (packet const & pkt);

PIXWIRE__NAMESPACE_END
