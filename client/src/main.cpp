#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <stop_token>
#include <thread>

#include "stowage/client/config.hpp"
#include "stowage/client/http_client.hpp"
#include "stowage/client/logger.hpp"
#include "stowage/client/transfer_driver.hpp"
#include "stowage/version.hpp"

int main(int argc, char *argv[])
{
    using namespace stowage::client;

    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        logger.log("info", "stowage-upload ", stowage::version(), " sending ", config.file.string(), " to ",
                   config.base_url);

        // Ctrl-C cancels backoff sleeps and the status wait.
        std::stop_source stop;
        boost::asio::io_context signal_context;
        boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([&stop](const boost::system::error_code &ec, int /*signal*/)
                           {
            if (!ec) {
                stop.request_stop();
            } });
        std::jthread signal_thread([&signal_context](std::stop_token token)
                                   {
            std::stop_callback halt(token, [&signal_context] { signal_context.stop(); });
            signal_context.run(); });

        HttpClient http;
        TransferDriver driver(config, http, logger, std::cerr);
        return driver.run(stop.get_token());
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
