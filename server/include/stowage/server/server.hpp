#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <thread>
#include <vector>

#include "stowage/server/change_feed.hpp"
#include "stowage/server/claim_coordinator.hpp"
#include "stowage/server/config.hpp"
#include "stowage/server/connection_pool.hpp"
#include "stowage/server/record_store.hpp"
#include "stowage/server/upload_service.hpp"

namespace stowage::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        // Safe to call from any thread.
        void stop();

        std::uint16_t local_port() const;

    private:
        void accept_next();
        void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
        void schedule_sweep();
        void handle_signal();

        ServerConfig config_;
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;
        boost::asio::steady_timer sweep_timer_;

        ConnectionPool pool_;
        ChangeFeed feed_;
        RecordStore store_;
        ClaimCoordinator claims_;
        UploadService uploads_;

        std::vector<std::thread> workers_;
    };

} // namespace stowage::server
