#include "treasury/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/strand.hpp>

#include <algorithm>
#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "treasury/server/session.hpp"

namespace treasury::server
{

    namespace
    {

        constexpr std::chrono::seconds kMaxExpirySweepInterval{60};

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          strand_(asio::make_strand(io_context_)),
          acceptor_(strand_),
          signals_(strand_),
          expiry_timer_(strand_),
          record_store_(config_.records_path()),
          access_tokens_(config_.access_tokens),
          uploads_(config_.upload_dir(), config_.storage_dir(), config_.max_pending_chunks),
          downloads_(io_context_, config_.storage_dir(), config_.download_idle_timeout),
          transfers_(uploads_, downloads_, record_store_)
    {
        uploads_.purge_orphaned_files();

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, config_.port, config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_upload_expiry();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{transfers_, access_tokens_, config_.max_frame_size};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_upload_expiry()
    {
        const auto interval = std::clamp<std::chrono::seconds>(config_.upload_timeout / 2, std::chrono::seconds{1},
                                                               kMaxExpirySweepInterval);
        expiry_timer_.expires_after(interval);
        expiry_timer_.async_wait([this](const std::error_code &ec)
                                 {
            if (ec)
            {
                return;
            }
            const auto expired = uploads_.expire_idle(config_.upload_timeout);
            if (expired > 0)
            {
                spdlog::info("Expired {} idle uploads, {} still active", expired, uploads_.active_count());
            }
            schedule_upload_expiry(); });
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        expiry_timer_.cancel();
        downloads_.shutdown();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace treasury::server
