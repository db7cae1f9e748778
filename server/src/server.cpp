#include "filedrop/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <memory>

#include <spdlog/spdlog.h>

#include "filedrop/server/session.hpp"

namespace filedrop::server
{

    namespace
    {

        std::size_t effective_worker_count(std::size_t configured)
        {
            if (configured != 0)
            {
                return configured;
            }
            const auto cores = std::thread::hardware_concurrency();
            return cores > 0 ? static_cast<std::size_t>(cores) : std::size_t{2};
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          worker_count_(effective_worker_count(config_.worker_threads)),
          io_context_(static_cast<int>(worker_count_)),
          acceptor_(io_context_),
          signals_(io_context_, SIGINT, SIGTERM),
          uploads_(config_.service_options())
    {
        open_acceptor();
        signals_.async_wait([this](const std::error_code &ec, int signal_number)
                            { on_signal(ec, signal_number); });
    }

    void Server::open_acceptor()
    {
        const asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.address), config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);

        spdlog::info("Listening on {}:{}, data in {}", config_.address, config_.port, config_.root.string());
        spdlog::info("Limits: file {} bytes, chunk {} bytes, frame {} bytes, downtime threshold {:.1f}s",
                     config_.max_file_size, config_.max_chunk_size, config_.max_frame_size(),
                     config_.downtime_threshold_seconds);
    }

    void Server::run()
    {
        accept_next();

        workers_.reserve(worker_count_ - 1);
        while (workers_.size() + 1 < worker_count_)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Serving with {} worker threads", worker_count_);
        io_context_.run();

        for (auto &worker : workers_)
        {
            worker.join();
        }
        workers_.clear();
        spdlog::info("Server stopped");
    }

    void Server::shutdown()
    {
        asio::post(io_context_, [this]
                   {
            std::error_code ignored;
            acceptor_.close(ignored);
            signals_.cancel(ignored);
            io_context_.stop(); });
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(const std::error_code &ec, asio::ip::tcp::socket socket)
    {
        if (!acceptor_.is_open() || ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            spdlog::warn("Failed to accept connection: {}", ec.message());
        }
        else
        {
            const ServerServices services{.uploads = uploads_, .max_frame_size = config_.max_frame_size()};
            std::make_shared<Session>(std::move(socket), services)->start();
        }
        accept_next();
    }

    void Server::on_signal(const std::error_code &ec, int signal_number)
    {
        if (ec)
        {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal_number);
        shutdown();
    }

} // namespace filedrop::server
