////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <pfs/i18n.hpp>
#include <cstdint>
#include <stdexcept>
#include <vector>

XFER__NAMESPACE_BEGIN

/**
 * Byte buffer used as serialization target and as deserialization result for
 * variable length fields (strings, chunk payloads).
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

    void append (char const * data, std::size_t n)
    {
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

    void erase_front (std::size_t n)
    {
        if (n == 0)
            return;

        if (n > size()) {
            throw std::range_error {
                tr::f_("range to erase from front is out of bounds: "
                    "number of elements to erase: {}, archive size: {}", n, size())
            };
        }

        _offset += n;

        if (size() == 0)
            clear();
    }

    /**
     * Moves content out of the archive.
     */
    container_type take ()
    {
        if (_offset > 0) {
            _c.erase(_c.begin(), _c.begin() + _offset);
            _offset = 0;
        }

        container_type result = std::move(_c);
        _c.clear();
        return result;
    }

    std::string to_string () const
    {
        return empty() ? std::string{} : std::string(data(), size());
    }
};

XFER__NAMESPACE_END
