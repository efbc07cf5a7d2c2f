#include "counselscript/net/http_client.hpp"
#include "counselscript/logging.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace counselscript::net {

class HttpClient::Impl {
public:
    explicit Impl(const EndpointSettings& endpoint)
        : ssl_context_(asio::ssl::context::tlsv12_client) {
        if (endpoint.use_tls) {
            ssl_context_.set_default_verify_paths();
            ssl_context_.set_verify_mode(asio::ssl::verify_peer);
        }
    }

    asio::ssl::context ssl_context_;
};

HttpClient::HttpClient(EndpointSettings endpoint)
    : endpoint_(std::move(endpoint)),
      impl_(std::make_unique<Impl>(endpoint_)) {}

HttpClient::HttpClient() = default;

HttpClient::~HttpClient() = default;

namespace {

http::request<http::string_body> build_request(const EndpointSettings& endpoint,
                                               const std::string& method,
                                               const std::string& target,
                                               const std::string& body) {
    http::request<http::string_body> req;
    req.method(http::string_to_verb(method));
    req.target(target);
    req.version(11);
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, "counselscript");
    req.set(http::field::content_type, "application/json");
    if (!endpoint.api_key.empty()) {
        req.set(http::field::authorization, "Bearer " + endpoint.api_key);
    }
    req.body() = body;
    req.prepare_payload();
    return req;
}

} // namespace

bool HttpClient::send_request(const std::string& method,
                              const std::string& target,
                              const std::string& body,
                              std::string& response) {
    const auto timeout = std::chrono::seconds(endpoint_.timeout_seconds);
    last_status_ = 0;

    try {
        LOG_DEBUG("Sending HTTP ", method, " ", endpoint_.host, ":", endpoint_.port, target);

        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port));

        auto req = build_request(endpoint_, method, target, body);
        beast::flat_buffer buffer;
        http::response<http::string_body> res;

        if (endpoint_.use_tls) {
            beast::ssl_stream<beast::tcp_stream> stream(ioc, impl_->ssl_context_);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                throw beast::system_error{ec};
            }
            beast::get_lowest_layer(stream).expires_after(timeout);
            beast::get_lowest_layer(stream).connect(results);
            stream.handshake(asio::ssl::stream_base::client);

            http::write(stream, req);
            http::read(stream, buffer, res);

            beast::error_code ec;
            stream.shutdown(ec);   // peers often drop TLS without close_notify
        } else {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout);
            stream.connect(results);

            http::write(stream, req);
            http::read(stream, buffer, res);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        last_status_ = static_cast<int>(res.result_int());
        response = std::move(res.body());

        if (last_status_ < 200 || last_status_ >= 300) {
            LOG_WARN("HTTP ", method, " ", target, " returned status ", last_status_);
            return false;
        }
        LOG_DEBUG("HTTP request completed with status ", last_status_);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("HTTP request failed: ", e.what());
        response.clear();
        return false;
    }
}

} // namespace counselscript::net
