////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/content_hasher.hpp"
#include "pfs/xfer/file.hpp"
#include <pfs/i18n.hpp>
#include <openssl/evp.h>

XFER__NAMESPACE_BEGIN

void content_hasher::context_deleter::operator () (evp_md_ctx_st * ctx) const noexcept
{
    EVP_MD_CTX_free(ctx);
}

content_hasher::content_hasher ()
    : _ctx(EVP_MD_CTX_new())
{
    if (!_ctx || EVP_DigestInit_ex(_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw error {
              make_error_code(errc::io_error)
            , tr::_("initialize SHA-256 digest context failure")
        };
    }
}

content_hasher::~content_hasher () = default;

void content_hasher::update (char const * data, std::size_t len)
{
    if (len == 0)
        return;

    if (EVP_DigestUpdate(_ctx.get(), data, len) != 1) {
        throw error {
              make_error_code(errc::io_error)
            , tr::_("update SHA-256 digest failure")
        };
    }
}

std::string content_hasher::finalize ()
{
    static char const * HEX = "0123456789abcdef";

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestFinal_ex(_ctx.get(), digest, & digest_len) != 1
            || EVP_DigestInit_ex(_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw error {
              make_error_code(errc::io_error)
            , tr::_("finalize SHA-256 digest failure")
        };
    }

    std::string result;
    result.reserve(digest_len * 2);

    for (unsigned int i = 0; i < digest_len; i++) {
        result.push_back(HEX[(digest[i] >> 4) & 0x0F]);
        result.push_back(HEX[digest[i] & 0x0F]);
    }

    return result;
}

std::string content_hasher::hash_file (pfs::filesystem::path const & path
    , std::size_t block_size, error * perr)
{
    error err;
    auto f = file::open_read_only(path, & err);

    if (!f) {
        pfs::throw_or(perr, error {
              make_error_code(errc::io_error)
            , tr::f_("hash file: {}", pfs::filesystem::utf8_encode(path))
            , err.what()
        });

        return std::string{};
    }

    if (block_size == 0)
        block_size = 4096;

    content_hasher h;
    std::vector<char> buffer(block_size);

    for (;;) {
        auto n = f.read(buffer.data(), static_cast<filesize_t>(buffer.size()), & err);

        if (n < 0) {
            pfs::throw_or(perr, error {
                  make_error_code(errc::io_error)
                , tr::f_("hash file: {}", pfs::filesystem::utf8_encode(path))
                , err.what()
            });

            return std::string{};
        }

        if (n == 0)
            break;

        h.update(buffer.data(), static_cast<std::size_t>(n));
    }

    return h.finalize();
}

bool content_hasher::is_valid (std::string const & s) noexcept
{
    if (s.size() != HEX_DIGEST_SIZE)
        return false;

    for (auto ch: s) {
        auto hex = (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');

        if (!hex)
            return false;
    }

    return true;
}

XFER__NAMESPACE_END
