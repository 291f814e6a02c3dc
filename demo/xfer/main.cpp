////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include <pfs/argvapi.hpp>
#include <pfs/filesystem.hpp>
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <pfs/string_view.hpp>
#include <pfs/xfer/file_protocol.hpp>
#include <pfs/xfer/file_service.hpp>
#include <pfs/xfer/udp_transport.hpp>
#include <chrono>
#include <csignal>
#include <limits>

using pfs::to_string;
static char const * TAG = "xfer-demo";

enum class mode_enum { none, upload, download, cleanup, service };

static xfer::file_service * g_service = nullptr;

static void sigterm_handler (int)
{
    if (g_service != nullptr)
        g_service->interrupt();
}

static void print_usage (pfs::filesystem::path const & programName
    , std::string const & errorString = std::string{})
{
    if (!errorString.empty())
        LOGE(TAG, "{}", errorString);

    fmt::println("Usage:\n\n"
        "{0} --help | -h\n"
        "{0} --upload=FILE --target=PATH --local=ADDR:PORT --remote=ADDR:PORT [OPTIONS]\n"
        "{0} --download=PATH --target=FILE --local=ADDR:PORT --remote=ADDR:PORT [OPTIONS]\n"
        "{0} --cleanup [--hash=HASH] --local=ADDR:PORT --remote=ADDR:PORT\n"
        "{0} --service --local=ADDR:PORT --remote=ADDR:PORT [OPTIONS]\n\n"

        "Options:\n\n"
        "--help | -h\n"
        "\tPrint this help and exit\n"
        "--upload=FILE\n"
        "\tSend local FILE to the service\n"
        "--download=PATH\n"
        "\tReceive file located at PATH on the service side\n"
        "--cleanup\n"
        "\tRequest the service to remove stored chunks\n"
        "--service\n"
        "\tRun as service (responder)\n"
        "--target=PATH\n"
        "\tDestination path (remote for upload, local for download)\n"
        "--hash=HASH\n"
        "\tContent hash to cleanup (whole storage if not specified)\n"
        "--local=ADDR:PORT\n"
        "\tLocal socket address\n"
        "--remote=ADDR:PORT\n"
        "\tPeer socket address (downlink address for service)\n"
        "--prefix=DIR\n"
        "\tStorage prefix (default is current directory)\n"
        "--chunk-size=SIZE\n"
        "\tChunk size in bytes from 1 to 65000 (default is 4096)\n"
        "--hold-count=COUNT\n"
        "\tMaximum number of unacknowledged chunks from 1 to 1000 (default is 5)\n"
        "--timeout=MILLIS\n"
        "\tReceive timeout in milliseconds from 1 to 600000 (default is 2000)\n"
        "--retries=COUNT\n"
        "\tMaximum number of consecutive timeouts, 0 - unlimited (default is 5)\n\n"

        "Examples:\n\n"
        "Run service:\n"
        "  {0} --service --local=0.0.0.0:7000 --remote=127.0.0.1:7001 --prefix=/tmp/service\n\n"
        "Upload file:\n"
        "  {0} --upload=data.bin --target=/tmp/data.bin --local=0.0.0.0:7001 --remote=127.0.0.1:7000\n"
        , programName);
}

template <typename T>
static bool parse_integer (pfs::string_view s, T min, T max, T & result, char const * name)
{
    std::error_code ec;
    auto n = pfs::to_integer(s.begin(), s.end(), min, max, ec);

    if (ec) {
        LOGE(TAG, "Bad {}: {}", name, ec.message());
        return false;
    }

    result = n;
    return true;
}

int main (int argc, char * argv[])
{
    mode_enum mode = mode_enum::none;
    std::string source;
    std::string target;
    pfs::optional<std::string> hash;
    pfs::optional<xfer::socket4_addr> localAddr;
    pfs::optional<xfer::socket4_addr> remoteAddr;
    xfer::protocol_config conf;

    auto commandLine = pfs::make_argvapi(argc, argv);
    auto programName = commandLine.program_name();
    auto commandLineIterator = commandLine.begin();

    if (!commandLineIterator.has_more()) {
        print_usage(programName);
        return EXIT_SUCCESS;
    }

    while (commandLineIterator.has_more()) {
        auto x = commandLineIterator.next();
        auto expectedArgError = false;

        if (x.is_option("help") || x.is_option("h")) {
            print_usage(programName);
            return EXIT_SUCCESS;
        } else if (x.is_option("upload") || x.is_option("download")) {
            if (x.has_arg()) {
                mode = x.is_option("upload") ? mode_enum::upload : mode_enum::download;
                source = to_string(x.arg());
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("cleanup")) {
            mode = mode_enum::cleanup;
        } else if (x.is_option("service")) {
            mode = mode_enum::service;
        } else if (x.is_option("target")) {
            if (x.has_arg())
                target = to_string(x.arg());
            else
                expectedArgError = true;
        } else if (x.is_option("hash")) {
            if (x.has_arg())
                hash = to_string(x.arg());
            else
                expectedArgError = true;
        } else if (x.is_option("local") || x.is_option("remote")) {
            if (x.has_arg()) {
                auto saddr = xfer::socket4_addr::parse(to_string(x.arg()));

                if (!saddr) {
                    LOGE(TAG, "Bad socket address for '{}'", to_string(x.optname()));
                    return EXIT_FAILURE;
                }

                if (x.is_option("local"))
                    localAddr = saddr;
                else
                    remoteAddr = saddr;
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("prefix")) {
            if (x.has_arg())
                conf.prefix = pfs::filesystem::utf8_decode(to_string(x.arg()));
            else
                expectedArgError = true;
        } else if (x.is_option("chunk-size")) {
            if (x.has_arg()) {
                if (!parse_integer(x.arg(), std::size_t{1}, std::size_t{65000}, conf.chunk_size, "chunk size"))
                    return EXIT_FAILURE;
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("hold-count")) {
            if (x.has_arg()) {
                if (!parse_integer(x.arg(), std::size_t{1}, std::size_t{1000}, conf.hold_count, "hold count"))
                    return EXIT_FAILURE;
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("timeout")) {
            if (x.has_arg()) {
                int t = 0;

                if (!parse_integer(x.arg(), int{1}, int{600000}, t, "timeout"))
                    return EXIT_FAILURE;

                conf.receive_timeout = std::chrono::milliseconds{t};
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("retries")) {
            if (x.has_arg()) {
                std::size_t n = 0;

                if (!parse_integer(x.arg(), std::size_t{0}, std::size_t{1000000}, n, "retries"))
                    return EXIT_FAILURE;

                if (n == 0)
                    conf.max_retries = pfs::nullopt;
                else
                    conf.max_retries = n;
            } else {
                expectedArgError = true;
            }
        } else {
            LOGE(TAG, "Bad arguments. Try --help option.");
            return EXIT_FAILURE;
        }

        if (expectedArgError) {
            print_usage(programName, "Expected argument for " + to_string(x.optname()));
            return EXIT_FAILURE;
        }
    }

    if (mode == mode_enum::none) {
        print_usage(programName, "No mode specified");
        return EXIT_FAILURE;
    }

    if (!localAddr || !remoteAddr) {
        LOGE(TAG, "Local and remote socket addresses must be specified");
        return EXIT_FAILURE;
    }

    if ((mode == mode_enum::upload || mode == mode_enum::download) && target.empty()) {
        LOGE(TAG, "No target path specified");
        return EXIT_FAILURE;
    }

    try {
        if (mode == mode_enum::service) {
            xfer::file_service::options opts;
            opts.listen_addr = *localAddr;
            opts.downlink_addr = *remoteAddr;
            opts.conf = conf;

            xfer::file_service service {opts};
            g_service = & service;
            std::signal(SIGINT, sigterm_handler);
            std::signal(SIGTERM, sigterm_handler);

            service.run();
            g_service = nullptr;
            return EXIT_SUCCESS;
        }

        xfer::udp_transport transport {*localAddr};
        xfer::file_protocol proto {transport, *remoteAddr, conf};
        auto channel = proto.generate_channel();

        switch (mode) {
            case mode_enum::upload: {
                auto fd = proto.initialize_file(pfs::filesystem::utf8_decode(source));

                proto.send_metadata(channel, fd->hash, fd->chunk_count);
                proto.send_export(channel, fd->hash, target, fd->mode);

                auto state = xfer::transfer_state::make_transmitting(channel, *fd);
                proto.message_engine(state);

                LOGI(TAG, "Uploaded: {} -> {} ({})", source, target, fd->hash);
                break;
            }

            case mode_enum::download: {
                proto.send_import_file(channel, source);

                auto state = xfer::transfer_state::make_start_receive(channel
                    , pfs::filesystem::utf8_decode(target));
                proto.message_engine(state);

                LOGI(TAG, "Downloaded: {} -> {} ({})", source, target, state.expected->hash);
                break;
            }

            case mode_enum::cleanup:
                proto.send_cleanup(channel, hash);
                LOGI(TAG, "Cleanup requested: {}", hash ? *hash : std::string{"whole storage"});
                break;

            default:
                break;
        }
    } catch (xfer::error const & ex) {
        LOGE(TAG, "{}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
