////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/filesystem.hpp>
#include <cstdint>
#include <string>
#include <vector>

XFER__NAMESPACE_BEGIN

namespace fs = pfs::filesystem;

using filesize_t = std::int64_t;

enum class truncate_enum: std::int8_t { off, on };

/**
 * POSIX file handle owner.
 */
class file
{
public:
    using handle_type = int;
    static constexpr handle_type INVALID_FILE_HANDLE = -1;

private:
    handle_type _h {INVALID_FILE_HANDLE};

private:
    file (handle_type h);

public:
    XFER__EXPORT file ();

    file (file const & f) = delete;
    file & operator = (file const & f) = delete;

    XFER__EXPORT file (file && f) noexcept;
    XFER__EXPORT file & operator = (file && f) noexcept;
    XFER__EXPORT ~file ();

    operator bool () const noexcept
    {
        return _h >= 0;
    }

    XFER__EXPORT void close () noexcept;

    /**
     * Reads up to @a len bytes into @a buffer.
     *
     * @return Actually read size, zero at end of file, or -1 on error (only
     *         when @a perr is not @c null, an exception is thrown otherwise).
     */
    XFER__EXPORT filesize_t read (char * buffer, filesize_t len, error * perr = nullptr) const;

    /**
     * Reads all remaining content.
     */
    XFER__EXPORT std::vector<char> read_all (error * perr = nullptr) const;

    /**
     * Writes whole buffer (repeats partial writes).
     */
    XFER__EXPORT bool write (char const * buffer, filesize_t count, error * perr = nullptr);

    /**
     * Flushes file content to the storage device.
     */
    XFER__EXPORT bool sync (error * perr = nullptr);

public: // static
    /**
     * Opens file for reading.
     *
     * @details Error codes:
     *          - @c std::errc::no_such_file_or_directory if file not found;
     *          - other POSIX-specific error codes returned by @c ::open.
     */
    static XFER__EXPORT file open_read_only (fs::path const & path, error * perr = nullptr);

    /**
     * Opens (creates if needed) file for writing with permissions @a mode.
     */
    static XFER__EXPORT file open_write_only (fs::path const & path, truncate_enum trunc
        , std::uint32_t mode, error * perr = nullptr);

    static file open_write_only (fs::path const & path, truncate_enum trunc
        , error * perr = nullptr)
    {
        return open_write_only(path, trunc, 0600, perr);
    }

    /**
     * Rewrites file with @a count bytes from @a buffer.
     */
    static XFER__EXPORT bool rewrite (fs::path const & path, char const * buffer
        , filesize_t count, error * perr = nullptr);

    static bool rewrite (fs::path const & path, std::string const & text, error * perr = nullptr)
    {
        return rewrite(path, text.c_str(), static_cast<filesize_t>(text.size()), perr);
    }

    static std::vector<char> read_all (fs::path const & path, error * perr = nullptr)
    {
        auto f = file::open_read_only(path, perr);

        if (f)
            return f.read_all(perr);

        return std::vector<char>{};
    }

    /**
     * Returns file permission bits (@c st_mode & 07777).
     */
    static XFER__EXPORT std::uint32_t permissions (fs::path const & path, error * perr = nullptr);

    /**
     * Sets file permission bits.
     */
    static XFER__EXPORT bool set_permissions (fs::path const & path, std::uint32_t mode
        , error * perr = nullptr);
};

XFER__NAMESPACE_END
