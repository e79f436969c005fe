#include "stowage/server/session.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http/chunk_encode.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

#include "stowage/framing.hpp"
#include "stowage/version.hpp"

namespace stowage::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;

    void Session::handle_events(const std::string &id)
    {
        try
        {
            subscription_ = services_.uploads.watch(id);
        }
        catch (const UploadError &ex)
        {
            send_error(ex);
            return;
        }

        spdlog::debug("{} subscribed to events of {}", remote_endpoint(), id);
        events_finished_ = false;
        events_response_.emplace(http::status::ok, parser_->get().version());
        events_response_->set(http::field::server, "stowage/" + std::string(stowage::version()));
        events_response_->set(http::field::content_type, "application/x-ndjson");
        events_response_->set(http::field::cache_control, "no-cache");
        events_response_->keep_alive(false);
        events_response_->chunked(true);
        events_serializer_.emplace(*events_response_);

        // The stream stays open until a terminal status; only the peer or a
        // shutdown ends it earlier.
        stream_.expires_never();
        http::async_write_header(stream_, *events_serializer_,
                                 [self = shared_from_this()](beast::error_code ec, std::size_t)
                                 { self->on_events_header(ec); });
    }

    void Session::on_events_header(beast::error_code ec)
    {
        if (ec)
        {
            spdlog::debug("Event stream header to {} failed: {}", remote_endpoint(), ec.message());
            end_event_stream();
            return;
        }
        watch_disconnect();
        wait_for_status();
    }

    void Session::watch_disconnect()
    {
        stream_.async_read_some(net::buffer(discard_buffer_),
                                [self = shared_from_this()](beast::error_code ec, std::size_t)
                                {
                                    if (ec)
                                    {
                                        self->end_event_stream();
                                        return;
                                    }
                                    self->watch_disconnect();
                                });
    }

    void Session::wait_for_status()
    {
        if (events_finished_ || !subscription_)
        {
            return;
        }
        auto executor = stream_.get_executor();
        subscription_->async_next([self = shared_from_this(), executor](std::optional<UploadStatus> status)
                                  { net::post(executor, [self, status]
                                              { self->on_status(status); }); });
    }

    void Session::on_status(std::optional<UploadStatus> status)
    {
        if (events_finished_)
        {
            return;
        }
        if (!status)
        {
            end_event_stream();
            return;
        }

        const protocol::UploadEvent event{
            .kind = protocol::EventKind::StatusChange,
            .status = *status,
        };
        pending_line_ = protocol::encode_line(nlohmann::json(event));
        const bool terminal = is_terminal(*status);
        net::async_write(stream_, http::make_chunk(net::buffer(pending_line_)),
                         [self = shared_from_this(), terminal](beast::error_code ec, std::size_t)
                         { self->on_event_written(ec, terminal); });
    }

    void Session::on_event_written(beast::error_code ec, bool terminal)
    {
        if (ec)
        {
            spdlog::debug("Event write to {} failed: {}", remote_endpoint(), ec.message());
            end_event_stream();
            return;
        }
        if (!terminal)
        {
            wait_for_status();
            return;
        }
        net::async_write(stream_, http::make_chunk_last(),
                         [self = shared_from_this()](beast::error_code, std::size_t)
                         { self->end_event_stream(); });
    }

    void Session::end_event_stream()
    {
        if (events_finished_)
        {
            return;
        }
        events_finished_ = true;
        if (subscription_)
        {
            subscription_->close();
        }
        beast::error_code ec;
        stream_.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        stream_.close();
    }

} // namespace stowage::server
