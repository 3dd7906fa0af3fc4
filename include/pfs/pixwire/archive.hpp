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
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

/**
 * Contiguous byte buffer with a lightweight erase-from-front.
 *
 * Used as the accumulation buffer of the parse role: bytes are appended at the back as they
 * arrive from the read queue and consumed frame by frame from the front. Consumed space is
 * reclaimed lazily, when the dead prefix becomes larger than the live tail.
 */
class archive
{
public:
    using container_type = std::vector<char>;

private:
    container_type _c;
    std::size_t _offset {0};

public:
    archive () = default;

    archive (char const * data, std::size_t n)
    {
        append(data, n);
    }

    archive (container_type && c) noexcept
        : _c(std::move(c))
    {}

    archive (archive && other) noexcept
        : _c(std::move(other._c))
        , _offset(other._offset)
    {
        other._offset = 0;
    }

    archive & operator = (archive && other) noexcept
    {
        if (this != & other) {
            _c = std::move(other._c);
            _offset = other._offset;
            other._offset = 0;
        }

        return *this;
    }

    archive (archive const & other)
        : archive(other.data(), other.size())
    {}

    archive & operator = (archive const &) = delete;

public:
    /**
     * Moves out the live bytes as a plain container.
     */
    container_type take ()
    {
        if (_offset > 0)
            _c.erase(_c.begin(), _c.begin() + _offset);

        _offset = 0;
        container_type result = std::move(_c);
        _c.clear();
        return result;
    }

    /**
     * @return @c nullptr on empty.
     */
    char const * data () const noexcept
    {
        return size() == 0 ? nullptr : _c.data() + _offset;
    }

    bool empty () const noexcept
    {
        return size() == 0;
    }

    std::size_t size () const noexcept
    {
        return _c.size() - _offset;
    }

    char operator [] (std::size_t pos) const noexcept
    {
        return _c[_offset + pos];
    }

    void reserve (std::size_t n)
    {
        _c.reserve(_offset + n);
    }

    void append (archive const & ar)
    {
        append(ar.data(), ar.size());
    }

    void append (container_type const & c)
    {
        append(c.data(), c.size());
    }

    void append (char const * data, std::size_t n)
    {
        if (n == 0)
            return;

        _c.insert(_c.end(), data, data + n);
    }

    void append (char ch)
    {
        _c.push_back(ch);
    }

    void clear ()
    {
        _c.clear();
        _offset = 0;
    }

    /**
     * Finds the first occurrence of @a ch starting from @a pos.
     *
     * @return Position of the character or @c size() if not found.
     */
    std::size_t find (char ch, std::size_t pos = 0) const noexcept
    {
        if (pos >= size())
            return size();

        auto first = _c.cbegin() + _offset + pos;
        auto it = std::find(first, _c.cend(), ch);
        return static_cast<std::size_t>(it - (_c.cbegin() + _offset));
    }

    /**
     * Extracts first @a n bytes.
     */
    container_type take_front (std::size_t n)
    {
        if (n > size()) {
            throw std::range_error {
                tr::f_("range to take from front is out of bounds: "
                    "number of elements to take: {}, container size: {}", n, size())
            };
        }

        auto first = _c.cbegin() + _offset;
        container_type result(first, first + n);
        erase_front(n);
        return result;
    }

    void erase_front (std::size_t n)
    {
        if (n == 0)
            return;

        if (n > size()) {
            throw std::range_error {
                tr::f_("range to erase from front is out of bounds: "
                    "number of elements to erase: {}, container size: {}", n, size())
            };
        }

        _offset += n;

        if (size() == 0) {
            clear();
        } else if (_offset > size()) {
            // Reclaim the dead prefix
            _c.erase(_c.begin(), _c.begin() + _offset);
            _offset = 0;
        }
    }
};

PIXWIRE__NAMESPACE_END
