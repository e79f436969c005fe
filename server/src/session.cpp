#include "stowage/server/session.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"
#include "stowage/version.hpp"

namespace stowage::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;

    namespace
    {

        constexpr std::size_t kBodyPieceSize = 256 * 1024;
        constexpr std::uint64_t kMaxJsonBody = 1024 * 1024;

        std::string server_header()
        {
            return "stowage/" + std::string(stowage::version());
        }

    } // namespace

    Session::Session(net::ip::tcp::socket socket, ServerServices services)
        : stream_(std::move(socket)),
          services_(std::move(services)),
          body_piece_(kBodyPieceSize) {}

    Session::~Session()
    {
        if (subscription_)
        {
            subscription_->close();
        }
    }

    void Session::start()
    {
        net::dispatch(stream_.get_executor(), [self = shared_from_this()]
                      { self->read_request(); });
    }

    void Session::read_request()
    {
        parser_.emplace();
        parser_->header_limit(16 * 1024);
        json_body_.clear();
        upload_id_.clear();
        range_writer_.reset();
        route_ = Route::Unknown;

        stream_.expires_after(services_.idle_timeout);
        http::async_read_header(stream_, buffer_, *parser_,
                                [self = shared_from_this()](beast::error_code ec, std::size_t)
                                { self->on_header(ec); });
    }

    void Session::on_header(beast::error_code ec)
    {
        if (ec == http::error::end_of_stream)
        {
            close();
            return;
        }
        if (ec)
        {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout)
            {
                spdlog::debug("Read from {} failed: {}", remote_endpoint(), ec.message());
            }
            return;
        }

        const auto target = std::string(parser_->get().target());
        const auto query_pos = target.find('?');
        path_ = target.substr(0, query_pos);
        query_ = query_pos == std::string::npos ? std::string{} : target.substr(query_pos + 1);
        dispatch();
    }

    void Session::dispatch()
    {
        const auto method = parser_->get().method();
        const auto segments = session_common::split_path(path_);

        if (segments.empty() && method == http::verb::get)
        {
            route_ = Route::Banner;
        }
        else if (segments.size() == 1 && segments[0] == "upload" && method == http::verb::post)
        {
            route_ = Route::NewUpload;
        }
        else if (segments.size() == 1 && segments[0] == "claim" && method == http::verb::post)
        {
            route_ = Route::Claim;
        }
        else if (segments.size() == 2 && segments[0] == "upload" && method == http::verb::get)
        {
            route_ = Route::GetUpload;
        }
        else if (segments.size() == 3 && segments[0] == "upload")
        {
            const auto &action = segments[2];
            if (action == "data" && method == http::verb::put)
            {
                route_ = Route::PutData;
            }
            else if (action == "finish" && method == http::verb::post)
            {
                route_ = Route::Finish;
            }
            else if (action == "abandon" && method == http::verb::post)
            {
                route_ = Route::Abandon;
            }
            else if (action == "status" && method == http::verb::post)
            {
                route_ = Route::UpdateStatus;
            }
            else if (action == "events" && method == http::verb::get)
            {
                route_ = Route::Events;
            }
        }
        if (segments.size() >= 2)
        {
            upload_id_ = segments[1];
        }

        if (route_ == Route::Unknown)
        {
            spdlog::warn("{} {} from {}: no such route", std::string(http::to_string(method)), path_,
                         remote_endpoint());
            send_envelope(http::status::not_found, protocol::make_not_found());
            return;
        }

        if (route_ == Route::PutData)
        {
            parser_->body_limit(services_.max_chunk_bytes);
            begin_put_data(upload_id_);
            if (!range_writer_)
            {
                return;
            }
        }
        else
        {
            parser_->body_limit(kMaxJsonBody);
        }

        if (parser_->is_done())
        {
            route_body_complete();
            return;
        }
        read_body();
    }

    void Session::read_body()
    {
        auto &body = parser_->get().body();
        body.data = body_piece_.data();
        body.size = body_piece_.size();
        stream_.expires_after(services_.idle_timeout);
        http::async_read_some(stream_, buffer_, *parser_,
                              [self = shared_from_this()](beast::error_code ec, std::size_t)
                              { self->on_body(ec); });
    }

    void Session::on_body(beast::error_code ec)
    {
        if (ec == http::error::need_buffer)
        {
            ec = {};
        }
        if (ec == http::error::body_limit)
        {
            spdlog::warn("Request body from {} exceeds the limit", remote_endpoint());
            send_envelope(http::status::payload_too_large, protocol::make_error("Request body too large"));
            return;
        }
        if (ec)
        {
            spdlog::debug("Body read from {} failed: {}", remote_endpoint(), ec.message());
            return;
        }

        const auto filled = body_piece_.size() - parser_->get().body().size;
        if (!consume_body(std::span<const std::byte>(body_piece_.data(), filled)))
        {
            return;
        }
        if (parser_->is_done())
        {
            route_body_complete();
            return;
        }
        read_body();
    }

    bool Session::consume_body(std::span<const std::byte> piece)
    {
        if (piece.empty())
        {
            return true;
        }
        if (route_ != Route::PutData)
        {
            json_body_.append(reinterpret_cast<const char *>(piece.data()), piece.size());
            return true;
        }
        try
        {
            range_writer_->write(piece);
            return true;
        }
        catch (const UploadError &ex)
        {
            spdlog::warn("Chunk write to {} at offset {} rejected: {}", upload_id_, range_writer_->offset(),
                         ex.what());
            range_writer_.reset();
            send_error(ex);
            return false;
        }
    }

    void Session::route_body_complete()
    {
        switch (route_)
        {
        case Route::Banner:
            send_text(http::status::ok, "stowage upload server " + std::string(stowage::version()) + "\n");
            break;
        case Route::NewUpload:
            handle_new_upload();
            break;
        case Route::GetUpload:
            handle_get_upload(upload_id_);
            break;
        case Route::PutData:
            finish_put_data();
            break;
        case Route::Finish:
            handle_finish(upload_id_);
            break;
        case Route::Abandon:
            handle_abandon(upload_id_);
            break;
        case Route::Claim:
            handle_claim();
            break;
        case Route::UpdateStatus:
            handle_update_status(upload_id_);
            break;
        case Route::Events:
            handle_events(upload_id_);
            break;
        case Route::Unknown:
            send_envelope(http::status::not_found, protocol::make_not_found());
            break;
        }
    }

    void Session::send_envelope(http::status status, const protocol::ResponseEnvelope &envelope)
    {
        auto response = std::make_shared<http::response<http::string_body>>(status, parser_->get().version());
        response->set(http::field::server, server_header());
        response->set(http::field::content_type, "application/json");
        // A response sent before the body was fully read leaves the stream
        // unusable for another request.
        response->keep_alive(parser_->is_done() && parser_->get().keep_alive());
        response->body() = nlohmann::json(envelope).dump();
        response->prepare_payload();
        stream_.expires_after(services_.idle_timeout);
        http::async_write(stream_, *response,
                          [self = shared_from_this(), response](beast::error_code ec, std::size_t)
                          { self->on_write(ec, response->need_eof()); });
    }

    void Session::send_text(http::status status, std::string body)
    {
        auto response = std::make_shared<http::response<http::string_body>>(status, parser_->get().version());
        response->set(http::field::server, server_header());
        response->set(http::field::content_type, "text/plain");
        response->keep_alive(parser_->is_done() && parser_->get().keep_alive());
        response->body() = std::move(body);
        response->prepare_payload();
        stream_.expires_after(services_.idle_timeout);
        http::async_write(stream_, *response,
                          [self = shared_from_this(), response](beast::error_code ec, std::size_t)
                          { self->on_write(ec, response->need_eof()); });
    }

    void Session::send_error(const UploadError &error)
    {
        if (error.code() == ErrorCode::NotFound)
        {
            send_envelope(http::status::not_found, protocol::make_not_found());
            return;
        }
        send_envelope(session_common::http_status_for(error.code()), protocol::make_error(error.what()));
    }

    void Session::on_write(beast::error_code ec, bool close_connection)
    {
        if (ec)
        {
            spdlog::debug("Write to {} failed: {}", remote_endpoint(), ec.message());
            return;
        }
        if (close_connection)
        {
            close();
            return;
        }
        read_request();
    }

    void Session::close()
    {
        beast::error_code ec;
        stream_.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
        // Keep reading until the peer closes; closing with unread request
        // bytes would reset the connection before the response is read.
        stream_.expires_after(std::chrono::seconds(10));
        watch_disconnect();
    }

    std::string Session::base_url_for(const std::string &id) const
    {
        std::string base;
        if (services_.public_url)
        {
            base = *services_.public_url;
        }
        else
        {
            const auto host = parser_->get()[http::field::host];
            base = "http://" + (host.empty() ? std::string("localhost") : std::string(host));
        }
        while (!base.empty() && base.back() == '/')
        {
            base.pop_back();
        }
        return base + "/upload/" + id;
    }

    std::string Session::remote_endpoint() const
    {
        beast::error_code ec;
        const auto endpoint = stream_.socket().remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace stowage::server
