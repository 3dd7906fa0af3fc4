////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/serializers/rencodeplus.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/serializer_traits.hpp"
#include <pfs/i18n.hpp>
#include <limits>
#include <string>

PIXWIRE__NAMESPACE_BEGIN

namespace serializers {

namespace {

constexpr std::uint8_t CHR_BYTES   = 47;
constexpr std::uint8_t CHR_LIST    = 59;
constexpr std::uint8_t CHR_DICT    = 60;
constexpr std::uint8_t CHR_INT     = 61;
constexpr std::uint8_t CHR_INT1    = 62;
constexpr std::uint8_t CHR_INT2    = 63;
constexpr std::uint8_t CHR_INT4    = 64;
constexpr std::uint8_t CHR_INT8    = 65;
constexpr std::uint8_t CHR_TRUE    = 67;
constexpr std::uint8_t CHR_FALSE   = 68;
constexpr std::uint8_t CHR_NONE    = 69;
constexpr std::uint8_t CHR_TERM    = 127;

constexpr std::uint8_t INT_POS_FIXED_START = 0;
constexpr std::uint8_t INT_POS_FIXED_COUNT = 44;
constexpr std::uint8_t INT_NEG_FIXED_START = 70;
constexpr std::uint8_t INT_NEG_FIXED_COUNT = 32;
constexpr std::uint8_t DICT_FIXED_START    = 102;
constexpr std::uint8_t DICT_FIXED_COUNT    = 25;
constexpr std::uint8_t STR_FIXED_START     = 128;
constexpr std::uint8_t STR_FIXED_COUNT     = 64;
constexpr std::uint8_t LIST_FIXED_START    = STR_FIXED_START + STR_FIXED_COUNT;
constexpr std::uint8_t LIST_FIXED_COUNT    = 64;

inline void put_code (archive & ar, std::uint8_t code)
{
    ar.append(static_cast<char>(code));
}

void encode_integer (archive & ar, std::int64_t n)
{
    serializer_t out {ar};

    if (n >= 0 && n < INT_POS_FIXED_COUNT) {
        put_code(ar, static_cast<std::uint8_t>(INT_POS_FIXED_START + n));
    } else if (n < 0 && n >= -static_cast<std::int64_t>(INT_NEG_FIXED_COUNT)) {
        put_code(ar, static_cast<std::uint8_t>(INT_NEG_FIXED_START - 1 - n));
    } else if (n >= (std::numeric_limits<std::int8_t>::min)()
            && n <= (std::numeric_limits<std::int8_t>::max)()) {
        put_code(ar, CHR_INT1);
        out << static_cast<std::uint8_t>(static_cast<std::int8_t>(n));
    } else if (n >= (std::numeric_limits<std::int16_t>::min)()
            && n <= (std::numeric_limits<std::int16_t>::max)()) {
        put_code(ar, CHR_INT2);
        out << static_cast<std::uint16_t>(static_cast<std::int16_t>(n));
    } else if (n >= (std::numeric_limits<std::int32_t>::min)()
            && n <= (std::numeric_limits<std::int32_t>::max)()) {
        put_code(ar, CHR_INT4);
        out << static_cast<std::uint32_t>(static_cast<std::int32_t>(n));
    } else {
        put_code(ar, CHR_INT8);
        out << static_cast<std::uint64_t>(n);
    }
}

void encode_text (archive & ar, char const * data, std::size_t n)
{
    if (n < STR_FIXED_COUNT) {
        put_code(ar, static_cast<std::uint8_t>(STR_FIXED_START + n));
    } else {
        auto s = std::to_string(n);
        ar.append(s.data(), s.size());
        ar.append(':');
    }

    ar.append(data, n);
}

void encode_bytes (archive & ar, char const * data, std::size_t n)
{
    put_code(ar, CHR_BYTES);
    auto s = std::to_string(n);
    ar.append(s.data(), s.size());
    ar.append(':');
    ar.append(data, n);
}

void encode_value (archive & ar, value const & v);

void encode_list (archive & ar, value::list_type const & items)
{
    bool fixed = items.size() < LIST_FIXED_COUNT;

    if (fixed)
        put_code(ar, static_cast<std::uint8_t>(LIST_FIXED_START + items.size()));
    else
        put_code(ar, CHR_LIST);

    for (auto const & x: items)
        encode_value(ar, x);

    if (!fixed)
        put_code(ar, CHR_TERM);
}

void encode_value (archive & ar, value const & v)
{
    switch (v.kind()) {
        case value_kind::null:
            throw error {
                  make_error_code(errc::encoding_error)
                , tr::_("null value can not be rencoded")
            };

        case value_kind::integer:
            encode_integer(ar, v.as_integer());
            break;

        case value_kind::boolean:
            put_code(ar, v.as_boolean() ? CHR_TRUE : CHR_FALSE);
            break;

        case value_kind::string: {
            auto const & s = v.as_string();
            encode_text(ar, s.data(), s.size());
            break;
        }

        case value_kind::bytes:
        case value_kind::compressed:
        case value_kind::compressible: {
            auto const & b = v.as_bytes();
            encode_bytes(ar, b.data(), b.size());
            break;
        }

        case value_kind::list:
            encode_list(ar, v.as_list());
            break;

        case value_kind::dict: {
            auto const & entries = v.as_dict();
            bool fixed = entries.size() < DICT_FIXED_COUNT;

            if (fixed)
                put_code(ar, static_cast<std::uint8_t>(DICT_FIXED_START + entries.size()));
            else
                put_code(ar, CHR_DICT);

            for (auto const & entry: entries) {
                encode_value(ar, entry.first);
                encode_value(ar, entry.second);
            }

            if (!fixed)
                put_code(ar, CHR_TERM);

            break;
        }

        case value_kind::large_structure:
            encode_value(ar, v.inner());
            break;
    }
}

class decoder
{
    char const * _p {nullptr};
    char const * _end {nullptr};

public:
    decoder (char const * data, std::size_t n)
        : _p(data)
        , _end(data + n)
    {}

public:
    bool at_end () const noexcept
    {
        return _p == _end;
    }

    std::size_t remain () const noexcept
    {
        return static_cast<std::size_t>(_end - _p);
    }

    value decode_value (int depth)
    {
        if (depth > MAX_NESTING_DEPTH)
            fail(tr::f_("nesting depth exceeds {}", MAX_NESTING_DEPTH));

        auto code = next_code();

        if (code < INT_POS_FIXED_START + INT_POS_FIXED_COUNT)
            return value {static_cast<int>(code - INT_POS_FIXED_START)};

        if (code >= INT_NEG_FIXED_START && code < INT_NEG_FIXED_START + INT_NEG_FIXED_COUNT)
            return value {-1 - static_cast<int>(code - INT_NEG_FIXED_START)};

        if (code >= STR_FIXED_START && code < STR_FIXED_START + STR_FIXED_COUNT) {
            auto n = static_cast<std::size_t>(code - STR_FIXED_START);
            return value {take_text(n)};
        }

        if (code >= LIST_FIXED_START) {
            auto n = static_cast<std::size_t>(code - LIST_FIXED_START);
            value::list_type items;
            items.reserve(n);

            for (std::size_t i = 0; i < n; i++)
                items.push_back(decode_value(depth + 1));

            return value::make_list(std::move(items));
        }

        if (code >= DICT_FIXED_START && code < DICT_FIXED_START + DICT_FIXED_COUNT) {
            auto n = static_cast<std::size_t>(code - DICT_FIXED_START);
            value::dict_type entries;
            entries.reserve(n);

            for (std::size_t i = 0; i < n; i++) {
                auto k = decode_value(depth + 1);
                auto v = decode_value(depth + 1);
                entries.emplace_back(std::move(k), std::move(v));
            }

            return value::make_dict(std::move(entries));
        }

        if (code >= '0' && code <= '9') {
            --_p;
            auto n = decode_length();
            return value {take_text(n)};
        }

        switch (code) {
            case CHR_BYTES: {
                auto n = decode_length();
                auto v = value::make_bytes(_p, n);
                _p += n;
                return v;
            }

            case CHR_LIST: {
                value::list_type items;

                while (peek_code() != CHR_TERM)
                    items.push_back(decode_value(depth + 1));

                ++_p;
                return value::make_list(std::move(items));
            }

            case CHR_DICT: {
                value::dict_type entries;

                while (peek_code() != CHR_TERM) {
                    auto k = decode_value(depth + 1);
                    auto v = decode_value(depth + 1);
                    entries.emplace_back(std::move(k), std::move(v));
                }

                ++_p;
                return value::make_dict(std::move(entries));
            }

            case CHR_INT:
                return value {decode_decimal(static_cast<char>(CHR_TERM))};

            case CHR_INT1: {
                std::uint8_t n = 0;
                read_be(n);
                return value {static_cast<std::int8_t>(n)};
            }

            case CHR_INT2: {
                std::uint16_t n = 0;
                read_be(n);
                return value {static_cast<std::int16_t>(n)};
            }

            case CHR_INT4: {
                std::uint32_t n = 0;
                read_be(n);
                return value {static_cast<std::int32_t>(n)};
            }

            case CHR_INT8: {
                std::uint64_t n = 0;
                read_be(n);
                return value {static_cast<std::int64_t>(n)};
            }

            case CHR_TRUE:
                return value {true};

            case CHR_FALSE:
                return value {false};

            case CHR_NONE:
                fail(tr::_("null value is not allowed"));
                break;

            default:
                break;
        }

        fail(tr::f_("unsupported type code {}", static_cast<unsigned int>(code)));
        return value{};
    }

private:
    [[noreturn]] void fail (std::string const & msg) const
    {
        throw error {
              make_error_code(errc::decoding_error)
            , tr::f_("rencodeplus: {}", msg)
        };
    }

    std::uint8_t peek_code () const
    {
        if (at_end())
            fail(tr::_("unexpected end of data"));

        return static_cast<std::uint8_t>(*_p);
    }

    std::uint8_t next_code ()
    {
        auto code = peek_code();
        ++_p;
        return code;
    }

    template <typename T>
    void read_be (T & n)
    {
        if (remain() < sizeof(T))
            fail(tr::_("unexpected end of data"));

        deserializer_t in {_p, sizeof(T)};
        in >> n;
        _p += sizeof(T);
    }

    std::string take_text (std::size_t n)
    {
        if (n > remain())
            fail(tr::f_("string length {} exceeds the data left: {}", n, remain()));

        std::string s(_p, n);
        _p += n;
        return s;
    }

    std::int64_t decode_decimal (char terminator)
    {
        bool negative = false;

        if (peek_code() == '-') {
            negative = true;
            ++_p;
        }

        std::uint64_t n = 0;
        int digits = 0;
        auto limit = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)())
            + (negative ? 1 : 0);

        while (static_cast<char>(peek_code()) != terminator) {
            char ch = *_p;

            if (ch < '0' || ch > '9')
                fail(tr::_("invalid decimal number"));

            auto digit = static_cast<std::uint64_t>(ch - '0');

            if (n > (limit - digit) / 10)
                fail(tr::_("integer overflow"));

            n = n * 10 + digit;
            ++digits;
            ++_p;
        }

        ++_p;

        if (digits == 0)
            fail(tr::_("invalid decimal number"));

        if (negative)
            return n == limit ? (std::numeric_limits<std::int64_t>::min)()
                : -static_cast<std::int64_t>(n);

        return static_cast<std::int64_t>(n);
    }

    std::size_t decode_length ()
    {
        auto n = decode_decimal(':');

        if (n < 0)
            fail(tr::_("negative length"));

        if (static_cast<std::uint64_t>(n) > remain())
            fail(tr::f_("length {} exceeds the data left: {}", n, remain()));

        return static_cast<std::size_t>(n);
    }
};

} // namespace

std::vector<char> rencodeplus::encode (packet const & pkt) const
{
    archive ar;
    encode_list(ar, pkt);
    return ar.take();
}

packet rencodeplus::decode (char const * data, std::size_t n) const
{
    decoder d {data, n};
    auto v = d.decode_value(0);

    if (!v.is_list()) {
        throw error {
              make_error_code(errc::decoding_error)
            , tr::_("rencodeplus: packet is not a list")
        };
    }

    if (!d.at_end()) {
        throw error {
              make_error_code(errc::decoding_error)
            , tr::f_("rencodeplus: {} trailing bytes after packet", d.remain())
        };
    }

    return std::move(v.as_list());
}

} // namespace serializers

PIXWIRE__NAMESPACE_END
