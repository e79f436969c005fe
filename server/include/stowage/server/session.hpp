#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/status.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "stowage/protocol.hpp"
#include "stowage/server/change_feed.hpp"
#include "stowage/server/chunk_writer.hpp"
#include "stowage/server/upload_service.hpp"

namespace stowage::server
{

    struct ServerServices
    {
        UploadService &uploads;
        std::optional<std::string> public_url;
        std::uint64_t max_chunk_bytes;
        std::chrono::seconds upload_timeout;
        // Longest gap allowed between reads or writes on one connection.
        std::chrono::milliseconds idle_timeout;
    };

    // One HTTP/1.1 connection. Requests are handled one at a time; the event
    // route turns the connection into a chunked stream until the upload
    // reaches a terminal status or the peer goes away.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(boost::asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

    private:
        using Parser = boost::beast::http::request_parser<boost::beast::http::buffer_body>;

        enum class Route
        {
            Banner,
            NewUpload,
            GetUpload,
            PutData,
            Finish,
            Abandon,
            Claim,
            UpdateStatus,
            Events,
            Unknown
        };

        void read_request();
        void on_header(boost::beast::error_code ec);
        void read_body();
        void on_body(boost::beast::error_code ec);
        bool consume_body(std::span<const std::byte> piece);
        void dispatch();
        void route_body_complete();
        void watch_disconnect();

        void send_envelope(boost::beast::http::status status, const protocol::ResponseEnvelope &envelope);
        void send_text(boost::beast::http::status status, std::string body);
        void send_error(const UploadError &error);
        void on_write(boost::beast::error_code ec, bool close);
        void close();

        // Route handlers
        void handle_new_upload();
        void handle_get_upload(const std::string &id);
        void begin_put_data(const std::string &id);
        void finish_put_data();
        void handle_finish(const std::string &id);
        void handle_abandon(const std::string &id);
        void handle_claim();
        void handle_update_status(const std::string &id);
        void handle_events(const std::string &id);

        // Event stream
        void on_events_header(boost::beast::error_code ec);
        void wait_for_status();
        void on_status(std::optional<UploadStatus> status);
        void on_event_written(boost::beast::error_code ec, bool terminal);
        void end_event_stream();

        std::string base_url_for(const std::string &id) const;
        std::string remote_endpoint() const;

        boost::beast::tcp_stream stream_;
        ServerServices services_;
        boost::beast::flat_buffer buffer_;
        std::optional<Parser> parser_;
        std::vector<std::byte> body_piece_;

        std::string path_;
        std::string query_;
        Route route_{Route::Unknown};
        std::string json_body_;
        std::string upload_id_;
        std::optional<RangeWriter> range_writer_;

        std::shared_ptr<StatusSubscription> subscription_;
        std::optional<boost::beast::http::response<boost::beast::http::empty_body>> events_response_;
        std::optional<boost::beast::http::response_serializer<boost::beast::http::empty_body>> events_serializer_;
        std::string pending_line_;
        std::array<char, 512> discard_buffer_{};
        bool events_finished_{false};
    };

} // namespace stowage::server
