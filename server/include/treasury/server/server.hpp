#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "treasury/server/access_tokens.hpp"
#include "treasury/server/config.hpp"
#include "treasury/server/downloads_manager.hpp"
#include "treasury/server/file_record_store.hpp"
#include "treasury/server/transfer_service.hpp"
#include "treasury/server/uploads_manager.hpp"

namespace treasury::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_upload_expiry();
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        // Serialises the acceptor, the signal handler and the expiry sweep.
        asio::strand<asio::io_context::executor_type> strand_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer expiry_timer_;

        JsonFileRecordStore record_store_;
        AccessTokens access_tokens_;
        UploadsManager uploads_;
        DownloadsManager downloads_;
        TransferService transfers_;

        std::vector<std::thread> workers_;
    };

} // namespace treasury::server
