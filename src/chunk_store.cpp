////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/chunk_store.hpp"
#include "pfs/xfer/content_hasher.hpp"
#include "pfs/xfer/file.hpp"
#include "pfs/xfer/serializer_traits.hpp"
#include "pfs/xfer/tag.hpp"
#include "pfs/xfer/trace.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <pfs/integer.hpp>
#include <pfs/numeric_cast.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <limits>
#include <unistd.h>

XFER__NAMESPACE_BEGIN

namespace fs = pfs::filesystem;

static char const * META_FILENAME = "meta";
static char const * PART_SUFFIX = ".part";

// Reads up to `len` bytes, stops at end of file only.
static filesize_t read_exact (file const & f, char * buffer, filesize_t len, error * perr)
{
    filesize_t total = 0;

    while (total < len) {
        auto n = f.read(buffer + total, len - total, perr);

        if (n < 0)
            return -1;

        if (n == 0)
            break;

        total += n;
    }

    return total;
}

static std::string chunk_filename (chunk_index index)
{
    return std::to_string(index);
}

// Temporary file beside `path`, unique among sessions of all processes
static fs::path temp_path_for (fs::path const & path)
{
    static std::atomic<std::uint32_t> counter {0};

    auto result = path;
    result += fs::utf8_decode("." + std::to_string(::getpid())
        + "-" + std::to_string(++counter) + PART_SUFFIX);
    return result;
}

// Parses chunk file name, other files (metadata, temporary files) are skipped
static pfs::optional<chunk_index> parse_chunk_filename (std::string const & name)
{
    if (name.empty() || !std::all_of(name.begin(), name.end()
            , [] (char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; })) {
        return pfs::nullopt;
    }

    std::error_code ec;
    auto index = pfs::to_integer(name.data(), name.data() + name.size()
        , chunk_index{0}, (std::numeric_limits<chunk_index>::max)(), ec);

    if (ec)
        return pfs::nullopt;

    return index;
}

std::vector<chunk_range> missing_ranges (std::set<chunk_index> const & present
    , std::uint32_t chunk_count, std::size_t max_ranges)
{
    std::vector<chunk_range> result;
    chunk_index next = 0;

    // Gaps between present indices
    for (auto index: present) {
        if (index >= chunk_count || result.size() >= max_ranges)
            return result;

        if (index > next)
            result.push_back(chunk_range{next, index});

        next = index + 1;
    }

    if (next < chunk_count && result.size() < max_ranges)
        result.push_back(chunk_range{next, chunk_count});

    return result;
}

chunk_store::chunk_store (fs::path const & prefix)
    : _root(prefix / "storage")
{}

fs::path chunk_store::content_dir (std::string const & hash) const
{
    // The digest is used as directory name so it must not contain path separators
    if (!content_hasher::is_valid(hash)) {
        throw error {
              errc::invalid_argument
            , tr::f_("bad content hash: {}", hash)
        };
    }

    return _root / fs::utf8_decode(hash);
}

bool chunk_store::ensure_directory (fs::path const & dir, error * perr) const
{
    if (!fs::exists(dir)) {
        std::error_code ec;

        fs::create_directories(dir, ec);

        if (ec) {
            pfs::throw_or(perr, error {
                  errc::io_error
                , tr::f_("create directory failure: {}", fs::utf8_encode(dir))
                , ec.message()
            });

            return false;
        }
    }

    return true;
}

bool chunk_store::put_chunk (std::string const & hash, chunk_index index
    , char const * data, std::size_t len, error * perr)
{
    auto dir = content_dir(hash);

    if (!ensure_directory(dir, perr))
        return false;

    auto path = dir / fs::utf8_decode(chunk_filename(index));
    auto tmp_path = temp_path_for(path);

    error err;

    {
        auto f = file::open_write_only(tmp_path, truncate_enum::on, & err);

        if (!f || !f.write(data, static_cast<filesize_t>(len), & err)) {
            std::error_code ec;
            fs::remove(tmp_path, ec);

            pfs::throw_or(perr, error {
                  errc::io_error
                , tr::f_("store chunk failure: {}", fs::utf8_encode(path))
                , err.what()
            });

            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);

    if (ec) {
        fs::remove(tmp_path, ec);

        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("store chunk failure: {}", fs::utf8_encode(path))
            , ec.message()
        });

        return false;
    }

    XFER__TRACE("[chunk_store] chunk stored: {}:{} ({} bytes)", hash, index, len);
    return true;
}

std::vector<char> chunk_store::get_chunk (std::string const & hash, chunk_index index
    , error * perr) const
{
    auto path = content_dir(hash) / fs::utf8_decode(chunk_filename(index));

    if (!fs::exists(path)) {
        pfs::throw_or(perr, error {
              errc::not_found
            , tr::f_("chunk not found: {}:{}", hash, index)
        });

        return std::vector<char>{};
    }

    error err;
    auto f = file::open_read_only(path, & err);

    if (f) {
        auto data = f.read_all(& err);

        if (!err)
            return data;
    }

    pfs::throw_or(perr, error {
          errc::io_error
        , tr::f_("read chunk failure: {}", fs::utf8_encode(path))
        , err.what()
    });

    return std::vector<char>{};
}

bool chunk_store::has_chunk (std::string const & hash, chunk_index index) const
{
    std::error_code ec;
    return fs::exists(content_dir(hash) / fs::utf8_decode(chunk_filename(index)), ec);
}

std::set<chunk_index> chunk_store::stored_chunks (std::string const & hash
    , std::uint32_t chunk_count) const
{
    std::set<chunk_index> result;
    auto dir = content_dir(hash);
    std::error_code ec;

    if (!fs::is_directory(dir, ec))
        return result;

    for (auto const & entry: fs::directory_iterator{dir, ec}) {
        auto index = parse_chunk_filename(fs::utf8_encode(entry.path().filename()));

        if (index && *index < chunk_count)
            result.insert(*index);
    }

    if (ec) {
        LOGW(XFER_TAG, "scan stored chunks failure: {}: {}", fs::utf8_encode(dir), ec.message());
    }

    return result;
}

bool chunk_store::layout_matches (std::string const & hash, std::uintmax_t file_size
    , std::size_t chunk_size, std::uint32_t chunk_count) const
{
    auto dir = content_dir(hash);

    for (chunk_index i = 0; i < chunk_count; i++) {
        auto offset = static_cast<std::uintmax_t>(i) * chunk_size;
        auto expected_size = (std::min)(static_cast<std::uintmax_t>(chunk_size), file_size - offset);

        std::error_code ec;
        auto size = fs::file_size(dir / fs::utf8_decode(chunk_filename(i)), ec);

        if (ec || size != expected_size)
            return false;
    }

    return true;
}

std::vector<char> chunk_store::reassemble (std::string const & hash
    , std::uint32_t chunk_count, error * perr) const
{
    std::vector<char> result;

    for (chunk_index i = 0; i < chunk_count; i++) {
        if (!has_chunk(hash, i)) {
            pfs::throw_or(perr, error {
                  errc::incomplete
                , tr::f_("reassemble failure: chunk {} of {} is missing", i, hash)
            });

            return std::vector<char>{};
        }

        error err;
        auto chunk = get_chunk(hash, i, & err);

        if (err) {
            pfs::throw_or(perr, std::move(err));
            return std::vector<char>{};
        }

        result.insert(result.end(), chunk.begin(), chunk.end());
    }

    return result;
}

bool chunk_store::reassemble_to (std::string const & hash, std::uint32_t chunk_count
    , fs::path const & target, std::uint32_t mode, error * perr) const
{
    for (chunk_index i = 0; i < chunk_count; i++) {
        if (!has_chunk(hash, i)) {
            pfs::throw_or(perr, error {
                  errc::incomplete
                , tr::f_("reassemble failure: chunk {} of {} is missing", i, hash)
            });

            return false;
        }
    }

    auto target_dir = target.parent_path();

    if (!target_dir.empty() && !ensure_directory(target_dir, perr))
        return false;

    auto tmp_path = temp_path_for(target);

    error err;
    content_hasher hasher;

    auto fail = [& tmp_path, perr] (error && e) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        pfs::throw_or(perr, std::move(e));
        return false;
    };

    {
        auto f = file::open_write_only(tmp_path, truncate_enum::on, & err);

        if (!f) {
            return fail(error {
                  errc::io_error
                , tr::f_("open file for reassembling failure: {}", fs::utf8_encode(tmp_path))
                , err.what()
            });
        }

        for (chunk_index i = 0; i < chunk_count; i++) {
            auto chunk = get_chunk(hash, i, & err);

            if (err)
                return fail(std::move(err));

            hasher.update(chunk.data(), chunk.size());

            if (!f.write(chunk.data(), static_cast<filesize_t>(chunk.size()), & err)) {
                return fail(error {
                      errc::io_error
                    , tr::f_("write reassembled file failure: {}", fs::utf8_encode(tmp_path))
                    , err.what()
                });
            }
        }

        if (!f.sync(& err)) {
            return fail(error {
                  errc::io_error
                , tr::f_("write reassembled file failure: {}", fs::utf8_encode(tmp_path))
                , err.what()
            });
        }
    }

    auto digest = hasher.finalize();

    if (digest != hash) {
        return fail(error {
              errc::hash_mismatch
            , tr::f_("content hash mismatch: expected {}, calculated {}", hash, digest)
        });
    }

    if (mode != 0 && !file::set_permissions(tmp_path, mode, & err)) {
        return fail(error {
              errc::io_error
            , tr::f_("set permissions failure: {}", fs::utf8_encode(tmp_path))
            , err.what()
        });
    }

    std::error_code ec;
    fs::rename(tmp_path, target, ec);

    if (ec) {
        return fail(error {
              errc::io_error
            , tr::f_("rename reassembled file failure: {}", fs::utf8_encode(target))
            , ec.message()
        });
    }

    LOGD(XFER_TAG, "file reassembled: {} ({} chunks) -> {}", hash, chunk_count
        , fs::utf8_encode(target));

    return true;
}

bool chunk_store::store_meta (file_descriptor const & fd, error * perr)
{
    auto dir = content_dir(fd.hash);

    if (!ensure_directory(dir, perr))
        return false;

    serializer_traits::archive_type ar;

    {
        serializer_traits::serializer_type out {ar};
        auto name_size = pfs::numeric_cast<std::uint16_t>(fd.name.size());
        auto hash_size = pfs::numeric_cast<std::uint16_t>(fd.hash.size());

        out << name_size;
        out.write(fd.name.data(), fd.name.size());
        out << hash_size;
        out.write(fd.hash.data(), fd.hash.size());
        out << fd.chunk_count << fd.mode;
    }

    error err;
    auto path = dir / fs::utf8_decode(META_FILENAME);
    auto tmp_path = temp_path_for(path);

    if (!file::rewrite(tmp_path, ar.data(), static_cast<filesize_t>(ar.size()), & err)) {
        std::error_code ec;
        fs::remove(tmp_path, ec);

        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("store metadata failure: {}", fs::utf8_encode(path))
            , err.what()
        });

        return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);

    if (ec) {
        fs::remove(tmp_path, ec);

        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("store metadata failure: {}", fs::utf8_encode(path))
            , ec.message()
        });

        return false;
    }

    return true;
}

pfs::optional<file_descriptor> chunk_store::load_meta (std::string const & hash
    , error * perr) const
{
    auto path = content_dir(hash) / fs::utf8_decode(META_FILENAME);

    if (!fs::exists(path))
        return pfs::nullopt;

    error err;
    auto data = file::read_all(path, & err);

    if (err) {
        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("load metadata failure: {}", fs::utf8_encode(path))
            , err.what()
        });

        return pfs::nullopt;
    }

    file_descriptor fd;
    serializer_traits::deserializer_type in {data.data(), data.size()};
    std::uint16_t name_size = 0;
    std::uint16_t hash_size = 0;
    archive name;
    archive stored_hash;

    in >> name_size;
    in.read(name, name_size);
    in >> hash_size;
    in.read(stored_hash, hash_size);
    in >> fd.chunk_count >> fd.mode;

    fd.name = name.to_string();
    fd.hash = stored_hash.to_string();

    if (!in.is_good() || fd.hash != hash) {
        pfs::throw_or(perr, error {
              errc::malformed
            , tr::f_("corrupted metadata: {}", fs::utf8_encode(path))
        });

        return pfs::nullopt;
    }

    return fd;
}

pfs::optional<file_descriptor> chunk_store::initialize_file (fs::path const & path
    , std::size_t chunk_size, std::size_t hash_block_size, error * perr)
{
    if (chunk_size == 0) {
        pfs::throw_or(perr, error {
              errc::invalid_argument
            , tr::_("chunk size must be greater than zero")
        });

        return pfs::nullopt;
    }

    error err;
    auto hash = content_hasher::hash_file(path, hash_block_size, & err);

    if (err) {
        pfs::throw_or(perr, std::move(err));
        return pfs::nullopt;
    }

    std::error_code ec;
    auto size = fs::file_size(path, ec);

    if (ec) {
        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("obtain file size failure: {}", fs::utf8_encode(path))
            , ec.message()
        });

        return pfs::nullopt;
    }

    auto count = (static_cast<std::uintmax_t>(size) + chunk_size - 1) / chunk_size;

    if (count > (std::numeric_limits<std::uint32_t>::max)()) {
        pfs::throw_or(perr, error {
              errc::invalid_argument
            , tr::f_("file too large for chunk size {}: {}", chunk_size, fs::utf8_encode(path))
        });

        return pfs::nullopt;
    }

    auto mode = file::permissions(path, & err);

    if (err) {
        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("obtain file permissions failure: {}", fs::utf8_encode(path))
            , err.what()
        });

        return pfs::nullopt;
    }

    file_descriptor fd;
    fd.name = fs::utf8_encode(path.filename());
    fd.hash = hash;
    fd.chunk_count = static_cast<std::uint32_t>(count);
    fd.mode = mode;

    error meta_err;
    auto existing = load_meta(hash, & meta_err);

    if (existing && existing->chunk_count == fd.chunk_count
            && stored_chunks(hash, fd.chunk_count).size() == fd.chunk_count
            && layout_matches(hash, size, chunk_size, fd.chunk_count)) {
        LOGD(XFER_TAG, "content already stored: {} ({})", fd.name, hash);
        return fd;
    }

    // Chunks split by another chunk size (or with corrupted metadata) are not reused
    if (existing || meta_err) {
        LOGD(XFER_TAG, "stored content split anew: {} ({})", fd.name, hash);

        if (!purge(hash, perr))
            return pfs::nullopt;
    }

    auto f = file::open_read_only(path, & err);

    if (!f) {
        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("open file failure: {}", fs::utf8_encode(path))
            , err.what()
        });

        return pfs::nullopt;
    }

    std::vector<char> buffer(chunk_size);

    for (chunk_index i = 0; i < fd.chunk_count; i++) {
        auto n = read_exact(f, buffer.data(), static_cast<filesize_t>(chunk_size), & err);

        // File changed since hashing
        if (n <= 0) {
            pfs::throw_or(perr, error {
                  errc::io_error
                , tr::f_("read file failure: {}", fs::utf8_encode(path))
                , err ? std::string{err.what()} : tr::_("unexpected end of file")
            });

            return pfs::nullopt;
        }

        if (!put_chunk(hash, i, buffer.data(), static_cast<std::size_t>(n), perr))
            return pfs::nullopt;
    }

    if (!store_meta(fd, perr))
        return pfs::nullopt;

    LOGD(XFER_TAG, "file initialized: {} ({}), {} bytes, {} chunks", fd.name, hash
        , size, fd.chunk_count);

    return fd;
}

bool chunk_store::purge (std::string const & hash, error * perr)
{
    auto dir = content_dir(hash);
    std::error_code ec;

    fs::remove_all(dir, ec);

    if (ec) {
        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("remove directory failure: {}", fs::utf8_encode(dir))
            , ec.message()
        });

        return false;
    }

    LOGD(XFER_TAG, "storage purged: {}", hash);
    return true;
}

bool chunk_store::purge_all (error * perr)
{
    std::error_code ec;

    fs::remove_all(_root, ec);

    if (ec) {
        pfs::throw_or(perr, error {
              errc::io_error
            , tr::f_("remove directory failure: {}", fs::utf8_encode(_root))
            , ec.message()
        });

        return false;
    }

    return true;
}

XFER__NAMESPACE_END
