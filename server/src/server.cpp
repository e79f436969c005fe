#include "stowage/server/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "stowage/server/session.hpp"

namespace stowage::server
{

    namespace net = boost::asio;

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::filesystem::path prepare_storage_root(const std::filesystem::path &root)
        {
            std::filesystem::create_directories(root);
            return std::filesystem::absolute(root).lexically_normal();
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          sweep_timer_(io_context_),
          pool_(config_.database_path, config_.pool_size),
          store_(pool_, feed_),
          claims_(pool_),
          uploads_(store_, claims_, prepare_storage_root(config_.storage_root))
    {
        const auto address = net::ip::make_address(config_.address);
        const net::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with storage {} and database {}", config_.address, local_port(),
                     uploads_.storage_root().string(), config_.database_path.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_sweep();

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
        workers_.clear();
    }

    void Server::stop()
    {
        net::post(io_context_, [this]
                  {
        boost::system::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        sweep_timer_.cancel();
        feed_.close_all();
        io_context_.stop(); });
    }

    std::uint16_t Server::local_port() const
    {
        boost::system::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(net::make_strand(io_context_),
                               [this](const boost::system::error_code &ec, net::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(boost::system::error_code ec, net::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{
                .uploads = uploads_,
                .public_url = config_.public_url,
                .max_chunk_bytes = config_.max_chunk_bytes,
                .upload_timeout = config_.upload_timeout,
                .idle_timeout = config_.idle_timeout,
            };
            auto session = std::make_shared<Session>(std::move(socket), std::move(services));
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == net::error::operation_aborted)
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

    void Server::schedule_sweep()
    {
        sweep_timer_.expires_after(config_.sweep_interval);
        sweep_timer_.async_wait([this](const boost::system::error_code &ec)
                                {
        if (ec) {
            return;
        }
        try {
            uploads_.abandon_expired(config_.upload_timeout);
        } catch (const UploadError &ex) {
            spdlog::error("Expiry sweep failed: {}", ex.what());
        }
        schedule_sweep(); });
    }

    void Server::handle_signal()
    {
        spdlog::info("Signal received, shutting down");
        boost::system::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        feed_.close_all();
        io_context_.stop();
    }

} // namespace stowage::server
