#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/verb.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "stowage/protocol.hpp"

namespace stowage::client
{

    enum class TransferErrorKind
    {
        Transport,
        BadStatusCode,
        BadResponse,
        JsonDecode,
        ProtocolViolation,
        UploadFailed,
        Exhausted
    };

    std::string_view to_string(TransferErrorKind kind) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(TransferErrorKind kind, const std::string &message, unsigned http_status = 0);

        TransferErrorKind kind() const noexcept { return kind_; }
        unsigned http_status() const noexcept { return http_status_; }

        // Transport failures, garbled responses, 5xx and 423 may succeed on a
        // later attempt. Everything else is a permanent rejection.
        bool retryable() const noexcept;

    private:
        TransferErrorKind kind_;
        unsigned http_status_;
    };

    struct Url
    {
        std::string host;
        std::string port;
        std::string target;
    };

    // Accepts http://host[:port][/path][?query]. Throws ProtocolViolation.
    Url parse_url(const std::string &url);

    std::string join_url(const std::string &base, std::string_view suffix);

    struct HttpResponse
    {
        unsigned status{0};
        std::string body;
    };

    // Line-delimited status events read from an open chunked response.
    class EventStream
    {
    public:
        explicit EventStream(std::string user_agent);
        ~EventStream();

        EventStream(const EventStream &) = delete;
        EventStream &operator=(const EventStream &) = delete;

        void open(const Url &url);

        // Empty once the server has ended the stream.
        std::optional<protocol::UploadEvent> next();

    private:
        using Parser = boost::beast::http::response_parser<boost::beast::http::buffer_body>;

        bool fill();

        std::string user_agent_;
        boost::asio::io_context io_context_;
        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        std::optional<Parser> parser_;
        std::array<char, 4096> piece_{};
        std::string pending_;
    };

    // Synchronous HTTP/1.1 client. Every request uses a fresh connection.
    class HttpClient
    {
    public:
        explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(300));

        const std::string &user_agent() const noexcept { return user_agent_; }

        HttpResponse request(boost::beast::http::verb method, const std::string &url, std::string body,
                             std::string_view content_type);

        // Sends a request and unwraps the response envelope. A status other
        // than expected_status, or a non-ok envelope, throws TransferError.
        nlohmann::json call(boost::beast::http::verb method, const std::string &url, std::string body,
                            std::string_view content_type, unsigned expected_status);

        nlohmann::json post_json(const std::string &url, const nlohmann::json &payload, unsigned expected_status);

        void put_bytes(const std::string &url, std::string bytes, unsigned expected_status);

        std::unique_ptr<EventStream> open_events(const std::string &url);

    private:
        std::string user_agent_;
        std::chrono::seconds timeout_;
    };

} // namespace stowage::client
