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
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

XFER__NAMESPACE_BEGIN

/**
 * SHA-256 digest of file content rendered as lowercase hexadecimal string.
 */
class content_hasher
{
public:
    static constexpr std::size_t DIGEST_SIZE = 32;
    static constexpr std::size_t HEX_DIGEST_SIZE = DIGEST_SIZE * 2;

private:
    struct context_deleter
    {
        void operator () (evp_md_ctx_st * ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, context_deleter> _ctx;

public:
    XFER__EXPORT content_hasher ();
    XFER__EXPORT ~content_hasher ();

    content_hasher (content_hasher const &) = delete;
    content_hasher & operator = (content_hasher const &) = delete;
    content_hasher (content_hasher &&) = default;
    content_hasher & operator = (content_hasher &&) = default;

    XFER__EXPORT void update (char const * data, std::size_t len);

    /**
     * Completes digest calculation. The hasher is reset and can be reused.
     */
    XFER__EXPORT std::string finalize ();

public: // static
    static std::string hash (char const * data, std::size_t len)
    {
        content_hasher h;
        h.update(data, len);
        return h.finalize();
    }

    static std::string hash (std::vector<char> const & data)
    {
        return hash(data.data(), data.size());
    }

    static std::string hash (std::string const & data)
    {
        return hash(data.data(), data.size());
    }

    /**
     * Calculates digest of the file content reading it by @a block_size blocks.
     *
     * @return Hex digest or empty string on error (if @a perr is not @c null).
     */
    static XFER__EXPORT std::string hash_file (pfs::filesystem::path const & path
        , std::size_t block_size, error * perr = nullptr);

    /**
     * Checks if @a s is a well-formed hex digest.
     */
    static XFER__EXPORT bool is_valid (std::string const & s) noexcept;
};

XFER__NAMESPACE_END
