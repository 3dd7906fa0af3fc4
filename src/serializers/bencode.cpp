////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/serializers/bencode.hpp"
#include "pfs/pixwire/archive.hpp"
#include "pfs/pixwire/error.hpp"
#include <pfs/i18n.hpp>
#include <limits>
#include <string>

PIXWIRE__NAMESPACE_BEGIN

namespace serializers {

namespace {

void encode_length (archive & ar, std::size_t n)
{
    auto s = std::to_string(n);
    ar.append(s.data(), s.size());
    ar.append(':');
}

void encode_value (archive & ar, value const & v)
{
    switch (v.kind()) {
        case value_kind::null:
            throw error {
                  make_error_code(errc::encoding_error)
                , tr::_("null value can not be bencoded")
            };

        case value_kind::integer:
        case value_kind::boolean: {
            auto s = std::to_string(v.as_integer());
            ar.append('i');
            ar.append(s.data(), s.size());
            ar.append('e');
            break;
        }

        case value_kind::string: {
            auto const & s = v.as_string();
            ar.append('u');
            encode_length(ar, s.size());
            ar.append(s.data(), s.size());
            break;
        }

        case value_kind::bytes:
        case value_kind::compressed:
        case value_kind::compressible: {
            auto const & b = v.as_bytes();
            encode_length(ar, b.size());
            ar.append(b);
            break;
        }

        case value_kind::list:
            ar.append('l');

            for (auto const & x: v.as_list())
                encode_value(ar, x);

            ar.append('e');
            break;

        case value_kind::dict:
            ar.append('d');

            for (auto const & entry: v.as_dict()) {
                encode_value(ar, entry.first);
                encode_value(ar, entry.second);
            }

            ar.append('e');
            break;

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

        if (at_end())
            fail(tr::_("unexpected end of data"));

        char ch = *_p;

        switch (ch) {
            case 'i': {
                ++_p;
                auto n = decode_integer('e');
                return value {n};
            }

            case 'u': {
                ++_p;
                auto n = decode_length();
                std::string s(_p, n);
                _p += n;
                return value {std::move(s)};
            }

            case 'l': {
                ++_p;
                value::list_type items;

                while (peek() != 'e')
                    items.push_back(decode_value(depth + 1));

                ++_p;
                return value::make_list(std::move(items));
            }

            case 'd': {
                ++_p;
                value::dict_type entries;

                while (peek() != 'e') {
                    auto k = decode_value(depth + 1);
                    auto v = decode_value(depth + 1);
                    entries.emplace_back(std::move(k), std::move(v));
                }

                ++_p;
                return value::make_dict(std::move(entries));
            }

            default:
                if (ch >= '0' && ch <= '9') {
                    auto n = decode_length();
                    auto v = value::make_bytes(_p, n);
                    _p += n;
                    return v;
                }

                fail(tr::f_("unexpected type code 0x{:02X}"
                    , static_cast<unsigned int>(static_cast<std::uint8_t>(ch))));
        }

        return value{};
    }

private:
    [[noreturn]] void fail (std::string const & msg) const
    {
        throw error {
              make_error_code(errc::decoding_error)
            , tr::f_("bencode: {}", msg)
        };
    }

    char peek () const
    {
        if (at_end())
            fail(tr::_("unexpected end of data"));

        return *_p;
    }

    std::int64_t decode_integer (char terminator)
    {
        bool negative = false;

        if (peek() == '-') {
            negative = true;
            ++_p;
        }

        std::uint64_t n = 0;
        int digits = 0;
        auto limit = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)())
            + (negative ? 1 : 0);

        while (peek() != terminator) {
            char ch = *_p;

            if (ch < '0' || ch > '9')
                fail(tr::_("invalid integer"));

            auto digit = static_cast<std::uint64_t>(ch - '0');

            if (n > (limit - digit) / 10)
                fail(tr::_("integer overflow"));

            n = n * 10 + digit;
            ++digits;
            ++_p;
        }

        ++_p;

        if (digits == 0 || (negative && n == 0))
            fail(tr::_("invalid integer"));

        if (negative)
            return n == (limit) ? (std::numeric_limits<std::int64_t>::min)()
                : -static_cast<std::int64_t>(n);

        return static_cast<std::int64_t>(n);
    }

    std::size_t decode_length ()
    {
        auto n = decode_integer(':');

        if (n < 0)
            fail(tr::_("negative length"));

        if (static_cast<std::uint64_t>(n) > remain())
            fail(tr::f_("length {} exceeds the data left: {}", n, remain()));

        return static_cast<std::size_t>(n);
    }
};

} // namespace

std::vector<char> bencode::encode (packet const & pkt) const
{
    archive ar;
    ar.append('l');

    for (auto const & x: pkt)
        encode_value(ar, x);

    ar.append('e');
    return ar.take();
}

packet bencode::decode (char const * data, std::size_t n) const
{
    if (n == 0 || data[0] != 'l') {
        throw error {
              make_error_code(errc::decoding_error)
            , tr::_("bencode: packet is not a list")
        };
    }

    decoder d {data, n};
    auto v = d.decode_value(0);

    if (!d.at_end()) {
        throw error {
              make_error_code(errc::decoding_error)
            , tr::f_("bencode: {} trailing bytes after packet", d.remain())
        };
    }

    return std::move(v.as_list());
}

} // namespace serializers

PIXWIRE__NAMESPACE_END
