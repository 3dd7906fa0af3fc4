////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/value.hpp"
#include "pfs/pixwire/error.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cstring>

PIXWIRE__NAMESPACE_BEGIN

static char const * kind_name (value_kind k)
{
    switch (k) {
        case value_kind::null: return "null";
        case value_kind::integer: return "integer";
        case value_kind::boolean: return "boolean";
        case value_kind::string: return "string";
        case value_kind::bytes: return "bytes";
        case value_kind::list: return "list";
        case value_kind::dict: return "dict";
        case value_kind::compressed: return "compressed";
        case value_kind::compressible: return "compressible";
        case value_kind::large_structure: return "large structure";
    }

    return "<unknown>";
}

static void throw_kind_mismatch (value_kind actual, char const * expected)
{
    throw error {
          make_error_code(errc::invalid_argument)
        , tr::f_("value kind mismatch: expected {}, actual {}", expected, kind_name(actual))
    };
}

value value::make_dict (dict_type d)
{
    value result;
    result._kind = value_kind::dict;

    std::stable_sort(d.begin(), d.end()
        , [] (std::pair<value, value> const & a, std::pair<value, value> const & b) {
            return a.first < b.first;
        });

    result._dict = std::move(d);
    return result;
}

value value::make_compressed (std::string datatype, bytes_type data, std::uint8_t level
    , bool can_inline)
{
    value result;
    result._kind = value_kind::compressed;
    result._str = std::move(datatype);
    result._bytes = std::move(data);
    result._level = level;
    result._can_inline = can_inline;
    result._level_compressed = level != 0;
    return result;
}

value value::make_compressible (std::string datatype, bytes_type data)
{
    value result;
    result._kind = value_kind::compressible;
    result._str = std::move(datatype);
    result._bytes = std::move(data);
    return result;
}

value value::make_large_structure (std::string datatype, value v)
{
    value result;
    result._kind = value_kind::large_structure;
    result._str = std::move(datatype);
    result._list.push_back(std::move(v));
    return result;
}

std::int64_t value::as_integer () const
{
    if (_kind != value_kind::integer && _kind != value_kind::boolean)
        throw_kind_mismatch(_kind, "integer");

    return _int;
}

bool value::as_boolean () const
{
    if (_kind != value_kind::integer && _kind != value_kind::boolean)
        throw_kind_mismatch(_kind, "boolean");

    return _int != 0;
}

std::string const & value::as_string () const
{
    if (_kind != value_kind::string)
        throw_kind_mismatch(_kind, "string");

    return _str;
}

value::bytes_type const & value::as_bytes () const
{
    if (_kind != value_kind::bytes && _kind != value_kind::compressed
            && _kind != value_kind::compressible) {
        throw_kind_mismatch(_kind, "bytes");
    }

    return _bytes;
}

value::bytes_type & value::as_bytes ()
{
    if (_kind != value_kind::bytes && _kind != value_kind::compressed
            && _kind != value_kind::compressible) {
        throw_kind_mismatch(_kind, "bytes");
    }

    return _bytes;
}

value::list_type const & value::as_list () const
{
    if (_kind != value_kind::list)
        throw_kind_mismatch(_kind, "list");

    return _list;
}

value::list_type & value::as_list ()
{
    if (_kind != value_kind::list)
        throw_kind_mismatch(_kind, "list");

    return _list;
}

value::dict_type const & value::as_dict () const
{
    if (_kind != value_kind::dict)
        throw_kind_mismatch(_kind, "dict");

    return _dict;
}

value const & value::inner () const
{
    if (_kind != value_kind::large_structure)
        throw_kind_mismatch(_kind, "large structure");

    return _list.front();
}

std::size_t value::size () const noexcept
{
    switch (_kind) {
        case value_kind::string:
            return _str.size();
        case value_kind::bytes:
        case value_kind::compressed:
        case value_kind::compressible:
            return _bytes.size();
        case value_kind::list:
            return _list.size();
        case value_kind::dict:
            return _dict.size();
        case value_kind::large_structure:
            return _list.front().size();
        default:
            break;
    }

    return 0;
}

value const * value::find (std::string const & key) const noexcept
{
    if (_kind != value_kind::dict)
        return nullptr;

    for (auto const & entry: _dict) {
        auto const & k = entry.first;

        if (k.is_string() && k._str == key)
            return & entry.second;

        if (k.is_bytes() && k._bytes.size() == key.size()
                && std::equal(k._bytes.begin(), k._bytes.end(), key.begin())) {
            return & entry.second;
        }
    }

    return nullptr;
}

void value::set (value key, value v)
{
    if (_kind != value_kind::dict)
        throw_kind_mismatch(_kind, "dict");

    auto pos = std::lower_bound(_dict.begin(), _dict.end(), key
        , [] (std::pair<value, value> const & entry, value const & k) {
            return entry.first < k;
        });

    if (pos != _dict.end() && pos->first == key)
        pos->second = std::move(v);
    else
        _dict.insert(pos, std::make_pair(std::move(key), std::move(v)));
}

std::string value::to_text () const
{
    if (_kind == value_kind::string)
        return _str;

    if (_kind == value_kind::bytes)
        return std::string(_bytes.begin(), _bytes.end());

    throw_kind_mismatch(_kind, "string");
    return std::string{};
}

template <typename T>
inline int compare_scalar (T const & a, T const & b) noexcept
{
    return a < b ? -1 : (b < a ? 1 : 0);
}

static int compare_bytes (char const * a, std::size_t an, char const * b, std::size_t bn) noexcept
{
    auto n = (std::min)(an, bn);

    if (n > 0) {
        auto r = std::memcmp(a, b, n);

        if (r != 0)
            return r < 0 ? -1 : 1;
    }

    return compare_scalar(an, bn);
}

int compare (value const & a, value const & b) noexcept
{
    if (a._kind != b._kind)
        return compare_scalar(static_cast<int>(a._kind), static_cast<int>(b._kind));

    switch (a._kind) {
        case value_kind::null:
            return 0;

        case value_kind::integer:
        case value_kind::boolean:
            return compare_scalar(a._int, b._int);

        case value_kind::string:
            return compare_bytes(a._str.data(), a._str.size(), b._str.data(), b._str.size());

        case value_kind::bytes:
            return compare_bytes(a._bytes.data(), a._bytes.size(), b._bytes.data(), b._bytes.size());

        case value_kind::list: {
            auto n = (std::min)(a._list.size(), b._list.size());

            for (std::size_t i = 0; i < n; i++) {
                auto r = compare(a._list[i], b._list[i]);

                if (r != 0)
                    return r;
            }

            return compare_scalar(a._list.size(), b._list.size());
        }

        case value_kind::dict: {
            auto n = (std::min)(a._dict.size(), b._dict.size());

            for (std::size_t i = 0; i < n; i++) {
                auto r = compare(a._dict[i].first, b._dict[i].first);

                if (r == 0)
                    r = compare(a._dict[i].second, b._dict[i].second);

                if (r != 0)
                    return r;
            }

            return compare_scalar(a._dict.size(), b._dict.size());
        }

        case value_kind::compressed:
        case value_kind::compressible: {
            auto r = compare_scalar(a._level, b._level);

            if (r == 0)
                r = compare_scalar(a._can_inline, b._can_inline);

            if (r == 0)
                r = compare_bytes(a._str.data(), a._str.size(), b._str.data(), b._str.size());

            if (r == 0)
                r = compare_bytes(a._bytes.data(), a._bytes.size(), b._bytes.data(), b._bytes.size());

            return r;
        }

        case value_kind::large_structure: {
            auto r = compare_bytes(a._str.data(), a._str.size(), b._str.data(), b._str.size());
            return r != 0 ? r : compare(a._list.front(), b._list.front());
        }
    }

    return 0;
}

static void ellipsize (std::string & out, std::string const & text, std::size_t limit)
{
    if (text.size() <= limit) {
        out += text;
    } else {
        out.append(text, 0, limit);
        out += "...";
    }
}

static void render (std::string & out, value const & v, std::size_t limit)
{
    switch (v.kind()) {
        case value_kind::null:
            out += "null";
            break;

        case value_kind::integer:
            out += std::to_string(v.as_integer());
            break;

        case value_kind::boolean:
            out += v.as_boolean() ? "true" : "false";
            break;

        case value_kind::string:
            out += '"';
            ellipsize(out, v.as_string(), limit);
            out += '"';
            break;

        case value_kind::bytes:
            out += tr::f_("bytes({})", v.size());
            break;

        case value_kind::list: {
            out += '[';
            bool first = true;

            for (auto const & x: v.as_list()) {
                if (out.size() > limit) {
                    out += ", ...";
                    break;
                }

                if (!first)
                    out += ", ";

                render(out, x, limit);
                first = false;
            }

            out += ']';
            break;
        }

        case value_kind::dict: {
            out += '{';
            bool first = true;

            for (auto const & entry: v.as_dict()) {
                if (out.size() > limit) {
                    out += ", ...";
                    break;
                }

                if (!first)
                    out += ", ";

                render(out, entry.first, limit);
                out += ": ";
                render(out, entry.second, limit);
                first = false;
            }

            out += '}';
            break;
        }

        case value_kind::compressed:
            if (v.level_compressed()) {
                out += tr::f_("LevelCompressed({}: {} bytes, level 0x{:02X})"
                    , v.datatype(), v.size(), static_cast<unsigned int>(v.level()));
            } else {
                out += tr::f_("Compressed({}: {} bytes)", v.datatype(), v.size());
            }

            break;

        case value_kind::compressible:
            out += tr::f_("Compressible({}: {} bytes)", v.datatype(), v.size());
            break;

        case value_kind::large_structure:
            out += tr::f_("LargeStructure({}: ", v.datatype());
            render(out, v.inner(), limit);
            out += ')';
            break;
    }
}

std::string to_string (value const & v, std::size_t limit)
{
    std::string result;
    render(result, v, limit);
    return result;
}

std::string to_string (packet const & pkt, std::size_t limit)
{
    std::string result;
    render(result, value::make_list(pkt), limit);
    return result;
}

std::string packet_type (packet const & pkt)
{
    if (pkt.empty())
        return std::string{};

    auto const & t = pkt.front();

    if (t.is_string())
        return t.as_string();

    if (t.is_bytes())
        return t.to_text();

    if (t.is_integer())
        return std::to_string(t.as_integer());

    return to_string(t);
}

static void validate_item (value const & v, std::string const & type, std::size_t index)
{
    switch (v.kind()) {
        case value_kind::null:
            throw error {
                  make_error_code(errc::encoding_error)
                , tr::f_("invalid null value in '{}' packet at index {}", type, index)
            };

        case value_kind::list:
            for (auto const & x: v.as_list())
                validate_item(x, type, index);
            break;

        case value_kind::dict:
            for (auto const & entry: v.as_dict()) {
                validate_item(entry.first, type, index);
                validate_item(entry.second, type, index);
            }
            break;

        case value_kind::large_structure:
            validate_item(v.inner(), type, index);
            break;

        default:
            break;
    }
}

void validate_packet (packet const & pkt)
{
    if (pkt.empty())
        throw error {make_error_code(errc::encoding_error), tr::_("empty packet")};

    auto const & t = pkt.front();

    if (!t.is_string() && !t.is_integer()) {
        throw error {
              make_error_code(errc::encoding_error)
            , tr::f_("invalid packet type: {}", to_string(t))
        };
    }

    auto type = packet_type(pkt);

    for (std::size_t i = 1; i < pkt.size(); i++)
        validate_item(pkt[i], type, i);
}

PIXWIRE__NAMESPACE_END
