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
#include <pfs/optional.hpp>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <vector>

XFER__NAMESPACE_BEGIN

using chunk_index = std::uint32_t;

struct file_descriptor
{
    std::string name;
    std::string hash;
    std::uint32_t chunk_count {0};
    std::uint32_t mode {0};
};

// Half-open range of chunk indices [first, last).
struct chunk_range
{
    chunk_index first;
    chunk_index last;

    bool operator == (chunk_range const & other) const noexcept
    {
        return first == other.first && last == other.last;
    }
};

/**
 * Content-addressed chunk storage.
 *
 * Layout:
 * ```
 * <prefix>/storage/<hash>/meta     - file descriptor
 * <prefix>/storage/<hash>/<index>  - chunk payloads
 * ```
 *
 * Files are written into uniquely named temporary files and renamed, so
 * sessions storing the same content concurrently do not interfere.
 */
class chunk_store
{
    pfs::filesystem::path _root;

public:
    XFER__EXPORT chunk_store (pfs::filesystem::path const & prefix);

    chunk_store (chunk_store const &) = delete;
    chunk_store & operator = (chunk_store const &) = delete;
    chunk_store (chunk_store &&) = default;
    chunk_store & operator = (chunk_store &&) = default;

public:
    pfs::filesystem::path const & root () const noexcept
    {
        return _root;
    }

    /**
     * Returns directory for chunks of content identified by @a hash.
     * Throws @c errc::invalid_argument if @a hash is not a well-formed digest.
     */
    XFER__EXPORT pfs::filesystem::path content_dir (std::string const & hash) const;

    /**
     * Stores chunk @a index of content @a hash. Overwrites existing chunk.
     */
    XFER__EXPORT bool put_chunk (std::string const & hash, chunk_index index
        , char const * data, std::size_t len, error * perr = nullptr);

    bool put_chunk (std::string const & hash, chunk_index index
        , std::vector<char> const & data, error * perr = nullptr)
    {
        return put_chunk(hash, index, data.data(), data.size(), perr);
    }

    XFER__EXPORT std::vector<char> get_chunk (std::string const & hash, chunk_index index
        , error * perr = nullptr) const;

    XFER__EXPORT bool has_chunk (std::string const & hash, chunk_index index) const;

    /**
     * Returns set of chunk indices in range [0, chunk_count) already present in the storage.
     */
    XFER__EXPORT std::set<chunk_index> stored_chunks (std::string const & hash
        , std::uint32_t chunk_count) const;

    /**
     * Concatenates chunks in index order. Fails with @c errc::incomplete if any
     * chunk is missing. Digest is not checked.
     */
    XFER__EXPORT std::vector<char> reassemble (std::string const & hash
        , std::uint32_t chunk_count, error * perr = nullptr) const;

    /**
     * Writes chunks into temporary file beside @a target, checks the digest and
     * renames temporary file to @a target. Permissions @a mode are applied if
     * non-zero. On digest mismatch temporary file is removed and
     * @c errc::hash_mismatch is reported.
     */
    XFER__EXPORT bool reassemble_to (std::string const & hash, std::uint32_t chunk_count
        , pfs::filesystem::path const & target, std::uint32_t mode
        , error * perr = nullptr) const;

    XFER__EXPORT bool store_meta (file_descriptor const & fd, error * perr = nullptr);

    /**
     * Loads file descriptor for content @a hash.
     *
     * @return Descriptor or @c nullopt if there is no metadata for @a hash (not an error).
     */
    XFER__EXPORT pfs::optional<file_descriptor> load_meta (std::string const & hash
        , error * perr = nullptr) const;

    /**
     * Hashes file @a path, splits it into chunks of @a chunk_size bytes and
     * stores chunks and descriptor. Already stored content is not split again
     * if it was split by the same chunk size, otherwise it is purged and split anew.
     */
    XFER__EXPORT pfs::optional<file_descriptor> initialize_file (pfs::filesystem::path const & path
        , std::size_t chunk_size, std::size_t hash_block_size, error * perr = nullptr);

    /**
     * Removes chunks and metadata of content @a hash.
     */
    XFER__EXPORT bool purge (std::string const & hash, error * perr = nullptr);

    /**
     * Removes whole storage content.
     */
    XFER__EXPORT bool purge_all (error * perr = nullptr);

private:
    bool ensure_directory (pfs::filesystem::path const & dir, error * perr) const;

    // Checks that stored chunks have boundaries of splitting content of
    // @a file_size bytes by @a chunk_size.
    bool layout_matches (std::string const & hash, std::uintmax_t file_size
        , std::size_t chunk_size, std::uint32_t chunk_count) const;
};

/**
 * Returns ranges of indices in range [0, chunk_count) absent in @a present.
 * At most @a max_ranges first ranges are returned.
 */
XFER__EXPORT std::vector<chunk_range> missing_ranges (std::set<chunk_index> const & present
    , std::uint32_t chunk_count
    , std::size_t max_ranges = (std::numeric_limits<std::size_t>::max)());

XFER__NAMESPACE_END
