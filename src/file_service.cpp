////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/file_service.hpp"
#include "pfs/xfer/codec.hpp"
#include "pfs/xfer/file_protocol.hpp"
#include "pfs/xfer/tag.hpp"
#include "pfs/xfer/trace.hpp"
#include "pfs/xfer/udp_transport.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <pfs/memory.hpp>
#include <condition_variable>
#include <deque>
#include <thread>

XFER__NAMESPACE_BEGIN

// Worker of a single channel. Serves as a transport for its engine: datagrams
// are delivered by the service loop, replies are sent through the service transport.
class file_service::session: public transport
{
    file_service * _service {nullptr};
    channel_id _channel {0};
    std::mutex _mtx;
    std::condition_variable _cv;
    std::deque<std::vector<char>> _queue;
    bool _closed {false};
    std::atomic<bool> _finished {false};
    std::thread _thread;

public:
    session (file_service * service, channel_id channel)
        : _service(service)
        , _channel(channel)
    {}

    ~session ()
    {
        close();
        join();
    }

    void start ()
    {
        _thread = std::thread {[this] { worker(); }};
    }

    void push (std::vector<char> && bytes)
    {
        std::unique_lock<std::mutex> locker{_mtx};
        _queue.push_back(std::move(bytes));
        _cv.notify_one();
    }

    void close ()
    {
        std::unique_lock<std::mutex> locker{_mtx};
        _closed = true;
        _cv.notify_all();
    }

    void join ()
    {
        if (_thread.joinable())
            _thread.join();
    }

    bool finished () const noexcept
    {
        return _finished;
    }

    void send (socket4_addr const & dest, char const * data, std::size_t len) override
    {
        _service->send_to(dest, data, len);
    }

    pfs::optional<std::vector<char>> recv (pfs::optional<std::chrono::milliseconds> timeout) override
    {
        std::unique_lock<std::mutex> locker{_mtx};
        auto ready = [this] { return _closed || !_queue.empty(); };

        if (timeout) {
            if (!_cv.wait_for(locker, *timeout, ready))
                return pfs::nullopt;
        } else {
            _cv.wait(locker, ready);
        }

        if (_queue.empty()) {
            throw error {
                  errc::transport_error
                , tr::f_("session closed: channel {}", _channel)
            };
        }

        auto bytes = std::move(_queue.front());
        _queue.pop_front();
        return bytes;
    }

private:
    void worker ()
    {
        error err;
        bool success = false;

        try {
            file_protocol proto {*this, _service->_opts.downlink_addr, _service->_opts.conf
                , _service->_registry};

            auto state = transfer_state::make_awaiting_metadata(_channel);
            success = proto.message_engine(state, & err);
        } catch (error const & ex) {
            err = ex;
        }

        if (success) {
            ++_service->_completed;
            LOGD(SERVICE_TAG, "channel {}: transfer complete", _channel);
        } else {
            ++_service->_failed;
            LOGE(SERVICE_TAG, "channel {}: {}", _channel, err.what());
        }

        _finished = true;
    }
};

file_service::file_service (options const & opts, std::unique_ptr<transport> t)
    : _opts(opts)
    , _transport(std::move(t))
    , _registry(std::make_shared<channel_registry>())
{
    validate(_opts.conf);

    if (!_transport)
        _transport = pfs::make_unique<udp_transport>(_opts.listen_addr);
}

file_service::~file_service ()
{
    reap(true);
}

void file_service::send_to (socket4_addr const & dest, char const * data, std::size_t len)
{
    std::unique_lock<std::mutex> locker{_send_mtx};
    _transport->send(dest, data, len);
}

void file_service::run ()
{
    LOGD(SERVICE_TAG, "service started: listen on {}, downlink to {}"
        , to_string(_opts.listen_addr), to_string(_opts.downlink_addr));

    while (!_interrupted) {
        auto bytes = _transport->recv(_opts.poll_interval);

        if (bytes)
            dispatch(std::move(*bytes));

        reap(false);
    }

    reap(true);

    LOGD(SERVICE_TAG, "service stopped: {} completed, {} failed", _completed.load(), _failed.load());
}

void file_service::dispatch (std::vector<char> && bytes)
{
    auto ch = peek_channel(bytes.data(), bytes.size());

    if (ch) {
        auto pos = _sessions.find(*ch);

        // Active session decodes by itself
        if (pos != _sessions.end() && !pos->second->finished()) {
            pos->second->push(std::move(bytes));
            return;
        }
    }

    error err;
    auto m = decode(bytes, & err);

    if (!m) {
        LOGW(SERVICE_TAG, "malformed datagram dropped: {}", err.what());
        return;
    }

    auto channel = channel_of(*m);
    auto pos = _sessions.find(channel);

    // Only session setup messages start a new session
    switch (type_of(*m)) {
        case message_enum::import_request:
        case message_enum::metadata:
        case message_enum::export_request:
        case message_enum::cleanup_request:
            break;

        default:
            XFER__TRACE("[file_service] {} for inactive channel {} dropped"
                , to_string(type_of(*m)), channel);
            return;
    }

    if (pos != _sessions.end()) {
        pos->second->join();
        _sessions.erase(pos);
    }

    LOGD(SERVICE_TAG, "channel {}: session started by {}", channel, to_string(type_of(*m)));

    auto s = pfs::make_unique<session>(this, channel);
    s->push(std::move(bytes));
    s->start();
    _sessions.emplace(channel, std::move(s));
}

void file_service::reap (bool all)
{
    for (auto pos = _sessions.begin(); pos != _sessions.end();) {
        if (all)
            pos->second->close();

        if (all || pos->second->finished()) {
            pos->second->join();
            pos = _sessions.erase(pos);
        } else {
            ++pos;
        }
    }
}

XFER__NAMESPACE_END
