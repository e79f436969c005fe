#include "stowage/client/http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <array>
#include <limits>

#include "stowage/framing.hpp"
#include "stowage/version.hpp"

namespace stowage::client
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    namespace
    {

        struct KindMapping
        {
            TransferErrorKind kind;
            std::string_view label;
        };

        constexpr std::array<KindMapping, 7> kKindMappings{{
            {TransferErrorKind::Transport, "transport"},
            {TransferErrorKind::BadStatusCode, "bad_status_code"},
            {TransferErrorKind::BadResponse, "bad_response"},
            {TransferErrorKind::JsonDecode, "json_decode"},
            {TransferErrorKind::ProtocolViolation, "protocol_violation"},
            {TransferErrorKind::UploadFailed, "upload_failed"},
            {TransferErrorKind::Exhausted, "exhausted"},
        }};

        constexpr std::string_view kHttpScheme = "http://";

        void connect(beast::tcp_stream &stream, net::io_context &io_context, const Url &url)
        {
            tcp::resolver resolver(io_context);
            beast::error_code ec;
            const auto endpoints = resolver.resolve(url.host, url.port, ec);
            if (ec)
            {
                throw TransferError(TransferErrorKind::Transport, "Cannot resolve " + url.host + ": " + ec.message());
            }
            stream.connect(endpoints, ec);
            if (ec)
            {
                throw TransferError(TransferErrorKind::Transport,
                                    "Cannot connect to " + url.host + ":" + url.port + ": " + ec.message());
            }
            stream.socket().set_option(net::socket_base::keep_alive(true), ec);
        }

        std::string describe_failure(const HttpResponse &response)
        {
            try
            {
                const auto envelope = nlohmann::json::parse(response.body).get<protocol::ResponseEnvelope>();
                if (envelope.kind == protocol::ResponseKind::NotFound)
                {
                    return "not found";
                }
                if (!envelope.message.empty())
                {
                    return envelope.message;
                }
            }
            catch (const std::exception &)
            {
                // Not an envelope; fall back to the raw body below.
            }
            return response.body.substr(0, 200);
        }

    } // namespace

    std::string_view to_string(TransferErrorKind kind) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    TransferError::TransferError(TransferErrorKind kind, const std::string &message, unsigned http_status)
        : std::runtime_error(message), kind_(kind), http_status_(http_status) {}

    bool TransferError::retryable() const noexcept
    {
        switch (kind_)
        {
        case TransferErrorKind::Transport:
        case TransferErrorKind::BadResponse:
        case TransferErrorKind::JsonDecode:
            return true;
        case TransferErrorKind::BadStatusCode:
            return http_status_ >= 500 || http_status_ == 423;
        case TransferErrorKind::ProtocolViolation:
        case TransferErrorKind::UploadFailed:
        case TransferErrorKind::Exhausted:
            return false;
        }
        return false;
    }

    Url parse_url(const std::string &url)
    {
        if (url.compare(0, kHttpScheme.size(), kHttpScheme) != 0)
        {
            throw TransferError(TransferErrorKind::ProtocolViolation, "Only http:// URLs are supported: " + url);
        }
        const auto rest = url.substr(kHttpScheme.size());
        const auto path_pos = rest.find_first_of("/?");
        const auto authority = rest.substr(0, path_pos);
        if (authority.empty())
        {
            throw TransferError(TransferErrorKind::ProtocolViolation, "URL has no host: " + url);
        }

        Url parsed;
        const auto colon = authority.rfind(':');
        if (colon == std::string::npos)
        {
            parsed.host = authority;
            parsed.port = "80";
        }
        else
        {
            parsed.host = authority.substr(0, colon);
            parsed.port = authority.substr(colon + 1);
            if (parsed.host.empty() || parsed.port.empty() ||
                parsed.port.find_first_not_of("0123456789") != std::string::npos)
            {
                throw TransferError(TransferErrorKind::ProtocolViolation, "Malformed host:port in " + url);
            }
        }

        parsed.target = path_pos == std::string::npos ? "/" : rest.substr(path_pos);
        if (parsed.target.front() == '?')
        {
            parsed.target.insert(parsed.target.begin(), '/');
        }
        return parsed;
    }

    std::string join_url(const std::string &base, std::string_view suffix)
    {
        std::string joined = base;
        while (!joined.empty() && joined.back() == '/')
        {
            joined.pop_back();
        }
        if (!suffix.empty() && suffix.front() != '/' && suffix.front() != '?')
        {
            joined.push_back('/');
        }
        joined.append(suffix);
        return joined;
    }

    EventStream::EventStream(std::string user_agent)
        : user_agent_(std::move(user_agent)), stream_(io_context_) {}

    EventStream::~EventStream()
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    void EventStream::open(const Url &url)
    {
        connect(stream_, io_context_, url);

        http::request<http::empty_body> request{http::verb::get, url.target, 11};
        request.set(http::field::host, url.host);
        request.set(http::field::user_agent, user_agent_);
        request.set(http::field::accept, "application/x-ndjson");

        beast::error_code ec;
        http::write(stream_, request, ec);
        if (ec)
        {
            throw TransferError(TransferErrorKind::Transport, "Event request failed: " + ec.message());
        }

        parser_.emplace();
        parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
        http::read_header(stream_, buffer_, *parser_, ec);
        if (ec)
        {
            throw TransferError(TransferErrorKind::Transport, "Event stream header read failed: " + ec.message());
        }
        const auto status = parser_->get().result_int();
        if (status != 200)
        {
            throw TransferError(TransferErrorKind::BadStatusCode,
                                "Event stream answered with HTTP " + std::to_string(status), status);
        }
    }

    std::optional<protocol::UploadEvent> EventStream::next()
    {
        while (true)
        {
            std::optional<protocol::DecodedLine> decoded;
            try
            {
                decoded = protocol::try_decode_line(pending_);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw TransferError(TransferErrorKind::JsonDecode, std::string("Bad event line: ") + ex.what());
            }
            if (decoded)
            {
                pending_.erase(0, decoded->bytes_consumed);
                try
                {
                    return decoded->message.get<protocol::UploadEvent>();
                }
                catch (const std::exception &ex)
                {
                    throw TransferError(TransferErrorKind::BadResponse, std::string("Bad event: ") + ex.what());
                }
            }
            if (!fill())
            {
                return std::nullopt;
            }
        }
    }

    bool EventStream::fill()
    {
        if (!parser_ || parser_->is_done())
        {
            return false;
        }
        auto &body = parser_->get().body();
        body.data = piece_.data();
        body.size = piece_.size();

        beast::error_code ec;
        http::read_some(stream_, buffer_, *parser_, ec);
        if (ec == http::error::need_buffer)
        {
            ec = {};
        }
        if (ec == http::error::end_of_stream || ec == net::error::eof)
        {
            return false;
        }
        if (ec)
        {
            throw TransferError(TransferErrorKind::Transport, "Event stream read failed: " + ec.message());
        }
        pending_.append(piece_.data(), piece_.size() - body.size);
        return true;
    }

    HttpClient::HttpClient(std::chrono::seconds timeout)
        : user_agent_("stowage-upload/" + std::string(stowage::version())), timeout_(timeout) {}

    HttpResponse HttpClient::request(http::verb method, const std::string &url, std::string body,
                                     std::string_view content_type)
    {
        const auto parsed = parse_url(url);
        net::io_context io_context;
        beast::tcp_stream stream(io_context);
        stream.expires_after(timeout_);
        connect(stream, io_context, parsed);

        http::request<http::string_body> request{method, parsed.target, 11};
        request.set(http::field::host, parsed.host);
        request.set(http::field::user_agent, user_agent_);
        if (!content_type.empty())
        {
            request.set(http::field::content_type, beast::string_view(content_type.data(), content_type.size()));
        }
        request.body() = std::move(body);
        request.prepare_payload();

        beast::error_code ec;
        http::write(stream, request, ec);
        if (ec)
        {
            throw TransferError(TransferErrorKind::Transport,
                                std::string(http::to_string(method)) + " " + url + " failed: " + ec.message());
        }

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(stream, buffer, response, ec);
        if (ec)
        {
            throw TransferError(TransferErrorKind::Transport, "Reading response of " + url + " failed: " + ec.message());
        }

        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return HttpResponse{
            .status = response.result_int(),
            .body = std::move(response.body()),
        };
    }

    nlohmann::json HttpClient::call(http::verb method, const std::string &url, std::string body,
                                    std::string_view content_type, unsigned expected_status)
    {
        const auto response = request(method, url, std::move(body), content_type);
        if (response.status != expected_status)
        {
            throw TransferError(TransferErrorKind::BadStatusCode,
                                "HTTP " + std::to_string(response.status) + " from " + url + ": " +
                                    describe_failure(response),
                                response.status);
        }

        protocol::ResponseEnvelope envelope;
        try
        {
            envelope = nlohmann::json::parse(response.body).get<protocol::ResponseEnvelope>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw TransferError(TransferErrorKind::JsonDecode, "Undecodable response from " + url + ": " + ex.what());
        }
        catch (const std::runtime_error &ex)
        {
            throw TransferError(TransferErrorKind::BadResponse, ex.what());
        }
        if (envelope.kind != protocol::ResponseKind::Ok)
        {
            throw TransferError(TransferErrorKind::BadResponse,
                                "Server answered " + std::string(protocol::to_string(envelope.kind)) + ": " +
                                    envelope.message);
        }
        return envelope.payload;
    }

    nlohmann::json HttpClient::post_json(const std::string &url, const nlohmann::json &payload,
                                         unsigned expected_status)
    {
        return call(http::verb::post, url, payload.dump(), "application/json", expected_status);
    }

    void HttpClient::put_bytes(const std::string &url, std::string bytes, unsigned expected_status)
    {
        call(http::verb::put, url, std::move(bytes), "application/octet-stream", expected_status);
    }

    std::unique_ptr<EventStream> HttpClient::open_events(const std::string &url)
    {
        auto stream = std::make_unique<EventStream>(user_agent_);
        stream->open(parse_url(url));
        return stream;
    }

} // namespace stowage::client
