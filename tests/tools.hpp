////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/filesystem.hpp>
#include <pfs/log.hpp>
#include <pfs/xfer/error.hpp>
#include <pfs/xfer/transport.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace tools {

namespace fs = pfs::filesystem;

#ifdef DOCTEST_VERSION
// See https://github.com/doctest/doctest/issues/345
inline char const * current_doctest_name ()
{
    return doctest::detail::g_cs->currentTest->m_name;
}
#endif

// Scratch directory removed at scope exit.
class temp_dir
{
    fs::path _path;

public:
    temp_dir ()
    {
        std::random_device rd;
        _path = fs::temp_directory_path() / fs::utf8_decode("xfer-test-" + std::to_string(rd()));
        fs::create_directories(_path);
    }

    ~temp_dir ()
    {
        std::error_code ec;
        fs::remove_all(_path, ec);
    }

    fs::path const & path () const noexcept
    {
        return _path;
    }

    fs::path operator / (std::string const & name) const
    {
        return _path / fs::utf8_decode(name);
    }
};

inline std::vector<char> random_bytes (std::size_t n, unsigned int seed = 42)
{
    std::mt19937 gen {seed};
    std::uniform_int_distribution<int> dist {0, 255};
    std::vector<char> result(n);

    for (auto & b: result)
        b = static_cast<char>(dist(gen));

    return result;
}

inline void write_file (fs::path const & path, std::vector<char> const & data)
{
    std::ofstream f {fs::utf8_encode(path), std::ios::binary | std::ios::trunc};
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline void write_file (fs::path const & path, std::string const & text)
{
    write_file(path, std::vector<char>(text.begin(), text.end()));
}

inline std::vector<char> read_file (fs::path const & path)
{
    std::ifstream f {fs::utf8_encode(path), std::ios::binary};
    return std::vector<char>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

/**
 * In-memory bidirectional datagram link with two endpoints. Datagrams sent by
 * one endpoint are received by the other one. Filter can drop datagrams to
 * simulate lossy link.
 */
class loopback_link
{
    struct queue
    {
        std::mutex mtx;
        std::condition_variable cv;
        std::deque<std::vector<char>> q;
    };

public:
    // Returns `true` if datagram must be dropped.
    using filter_type = std::function<bool (std::vector<char> const &)>;

    class endpoint: public xfer::transport
    {
        friend class loopback_link;

        queue * _inbox {nullptr};
        queue * _outbox {nullptr};
        filter_type _filter;
        std::atomic<std::size_t> _sent {0};
        std::atomic<std::size_t> _dropped {0};

    public:
        void set_filter (filter_type f)
        {
            _filter = std::move(f);
        }

        std::size_t sent_count () const noexcept
        {
            return _sent;
        }

        std::size_t dropped_count () const noexcept
        {
            return _dropped;
        }

        void send (xfer::socket4_addr const &, char const * data, std::size_t len) override
        {
            std::vector<char> bytes(data, data + len);

            ++_sent;

            if (_filter && _filter(bytes)) {
                ++_dropped;
                return;
            }

            std::unique_lock<std::mutex> locker{_outbox->mtx};
            _outbox->q.push_back(std::move(bytes));
            _outbox->cv.notify_one();
        }

        pfs::optional<std::vector<char>> recv (pfs::optional<std::chrono::milliseconds> timeout) override
        {
            std::unique_lock<std::mutex> locker{_inbox->mtx};
            auto ready = [this] { return !_inbox->q.empty(); };

            if (timeout) {
                if (!_inbox->cv.wait_for(locker, *timeout, ready))
                    return pfs::nullopt;
            } else {
                _inbox->cv.wait(locker, ready);
            }

            auto bytes = std::move(_inbox->q.front());
            _inbox->q.pop_front();
            return bytes;
        }
    };

private:
    queue _q[2];
    endpoint _a;
    endpoint _b;

public:
    loopback_link ()
    {
        _a._inbox = & _q[0];
        _a._outbox = & _q[1];
        _b._inbox = & _q[1];
        _b._outbox = & _q[0];
    }

    endpoint & a () noexcept { return _a; }
    endpoint & b () noexcept { return _b; }
};

} // namespace tools
