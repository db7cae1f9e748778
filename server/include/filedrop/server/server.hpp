#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstddef>
#include <system_error>
#include <thread>
#include <vector>

#include "filedrop/server/config.hpp"
#include "filedrop/server/upload_service.hpp"

namespace filedrop::server
{

    // Accepts connections on the configured endpoint and runs one Session per
    // client on a shared pool of io_context threads. SIGINT/SIGTERM stop it.
    class Server
    {
    public:
        explicit Server(ServerConfig config);

        // Blocks until shutdown() or a termination signal.
        void run();

        void shutdown();

    private:
        void open_acceptor();
        void accept_next();
        void on_accept(const std::error_code &ec, asio::ip::tcp::socket socket);
        void on_signal(const std::error_code &ec, int signal_number);

        ServerConfig config_;
        std::size_t worker_count_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        UploadService uploads_;

        std::vector<std::thread> workers_;
    };

} // namespace filedrop::server
