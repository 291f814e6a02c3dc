////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/file.hpp"
#include <pfs/i18n.hpp>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

XFER__NAMESPACE_BEGIN

namespace details {

static error make_system_error (std::string const & description)
{
    return error {
          std::error_code(errno, std::generic_category())
        , description
    };
}

} // namespace details

file::file (handle_type h) : _h(h) {}
file::file () = default;

file::file (file && f) noexcept
    : _h(f._h)
{
    f._h = INVALID_FILE_HANDLE;
}

file & file::operator = (file && f) noexcept
{
    if (this != & f) {
        close();
        _h = f._h;
        f._h = INVALID_FILE_HANDLE;
    }

    return *this;
}

file::~file ()
{
    close();
}

void file::close () noexcept
{
    if (_h >= 0)
        ::close(_h);

    _h = INVALID_FILE_HANDLE;
}

filesize_t file::read (char * buffer, filesize_t len, error * perr) const
{
    if (len == 0)
        return 0;

    if (len < 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::invalid_argument)
            , tr::_("invalid buffer length")
        });

        return -1;
    }

    ssize_t n = 0;

    do {
        n = ::read(_h, buffer, static_cast<std::size_t>(len));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        pfs::throw_or(perr, details::make_system_error(tr::_("read from file")));
        return -1;
    }

    return static_cast<filesize_t>(n);
}

std::vector<char> file::read_all (error * perr) const
{
    std::vector<char> result;
    char buffer[4096];

    auto n = read(buffer, sizeof(buffer), perr);

    while (n > 0) {
        result.insert(result.end(), buffer, buffer + n);
        n = read(buffer, sizeof(buffer), perr);
    }

    return n < 0 ? std::vector<char>{} : result;
}

bool file::write (char const * buffer, filesize_t count, error * perr)
{
    filesize_t total = 0;

    while (total < count) {
        auto n = ::write(_h, buffer + total, static_cast<std::size_t>(count - total));

        if (n < 0) {
            if (errno == EINTR)
                continue;

            pfs::throw_or(perr, details::make_system_error(tr::_("write into file")));
            return false;
        }

        total += n;
    }

    return true;
}

bool file::sync (error * perr)
{
    if (::fsync(_h) != 0) {
        pfs::throw_or(perr, details::make_system_error(tr::_("synchronize file")));
        return false;
    }

    return true;
}

file file::open_read_only (fs::path const & path, error * perr)
{
    if (!fs::exists(path)) {
        pfs::throw_or(perr, error {
              make_error_code(std::errc::no_such_file_or_directory)
            , tr::f_("file not found: {}", fs::utf8_encode(path))
        });

        return file{};
    }

    handle_type h = ::open(fs::utf8_encode(path).c_str(), O_RDONLY | O_CLOEXEC);

    if (h < 0) {
        pfs::throw_or(perr, details::make_system_error(
            tr::f_("open read only file: {}", fs::utf8_encode(path))));
        return file{};
    }

    return file{h};
}

file file::open_write_only (fs::path const & path, truncate_enum trunc
    , std::uint32_t mode, error * perr)
{
    int oflags = O_WRONLY | O_CREAT | O_CLOEXEC;

    if (trunc == truncate_enum::on)
        oflags |= O_TRUNC;

    handle_type h = ::open(fs::utf8_encode(path).c_str(), oflags, static_cast<mode_t>(mode));

    if (h < 0) {
        pfs::throw_or(perr, details::make_system_error(
            tr::f_("open write only file: {}", fs::utf8_encode(path))));
        return file{};
    }

    return file{h};
}

bool file::rewrite (fs::path const & path, char const * buffer
    , filesize_t count, error * perr)
{
    file f = open_write_only(path, truncate_enum::on, perr);

    if (f)
        return f.write(buffer, count, perr);

    return false;
}

std::uint32_t file::permissions (fs::path const & path, error * perr)
{
    struct stat st;

    if (::stat(fs::utf8_encode(path).c_str(), & st) != 0) {
        pfs::throw_or(perr, details::make_system_error(
            tr::f_("read file status: {}", fs::utf8_encode(path))));
        return 0;
    }

    return static_cast<std::uint32_t>(st.st_mode & 07777);
}

bool file::set_permissions (fs::path const & path, std::uint32_t mode, error * perr)
{
    if (::chmod(fs::utf8_encode(path).c_str(), static_cast<mode_t>(mode & 07777)) != 0) {
        pfs::throw_or(perr, details::make_system_error(
            tr::f_("set file permissions: {}", fs::utf8_encode(path))));
        return false;
    }

    return true;
}

XFER__NAMESPACE_END
