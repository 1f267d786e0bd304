#include <transport/websocket_stream.hpp>

#include <chrono>
#include <concepts/websocket_stream.hpp>

namespace status_feed::transport {

static_assert(concepts::websocket_stream<websocket_stream>);

auto parse_websocket_url(std::string_view url) -> std::optional<websocket_endpoint>
{
  static constexpr std::string_view secure_prefix = "wss://";
  if (not url.starts_with(secure_prefix)) { return std::nullopt; }
  url.remove_prefix(secure_prefix.size());

  websocket_endpoint endpoint{ .host = "", .port = "443", .path = "/" };

  auto slash_pos = url.find('/');
  if (slash_pos != std::string_view::npos) {
    endpoint.host = std::string(url.substr(0, slash_pos));
    endpoint.path = std::string(url.substr(slash_pos));
  } else {
    endpoint.host = std::string(url);
  }

  auto colon_pos = endpoint.host.find(':');
  if (colon_pos != std::string::npos) {
    endpoint.port = endpoint.host.substr(colon_pos + 1);
    endpoint.host.resize(colon_pos);
  }

  if (endpoint.host.empty() or endpoint.port.empty()) { return std::nullopt; }
  return endpoint;
}

websocket_stream::websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context)
  : ssl_context_(boost::asio::ssl::context::tlsv12_client), resolver_(*io_context),
    ws_(boost::asio::make_strand(*io_context), ssl_context_)
{
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(boost::asio::ssl::verify_peer);
}

auto websocket_stream::async_connect(websocket_connection_params params,
  std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void
{
  namespace beast = boost::beast;

  auto host_str = std::string(params.host);
  auto port_str = std::string(params.port);
  auto path_str = std::string(params.path);

  resolver_.async_resolve(host_str,
    port_str,
    [this, host_str, port_str, path_str, handler = std::move(handler)](const boost::system::error_code &error_code,
      const boost::asio::ip::tcp::resolver::results_type &results) mutable {
      if (error_code) {
        handler(error_code, 0);
        return;
      }

      beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(connection_timeout_seconds));

      beast::get_lowest_layer(ws_).async_connect(results,
        [this, host_str, path_str, handler = std::move(handler)](
          const boost::system::error_code &connect_error, const boost::asio::ip::tcp::endpoint & /*endpoint*/) mutable {
          if (connect_error) {
            handler(connect_error, 0);
            return;
          }

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
          if (not SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_str.c_str())) {
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
            handler(boost::asio::error::operation_not_supported, 0);
            return;
          }

          ws_.next_layer().async_handshake(boost::asio::ssl::stream_base::client,
            [this, host_str, path_str, handler = std::move(handler)](
              const boost::system::error_code &ssl_error) mutable {
              if (ssl_error) {
                handler(ssl_error, 0);
                return;
              }

              beast::get_lowest_layer(ws_).expires_never();

              ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
              ws_.set_option(beast::websocket::stream_base::decorator([](beast::websocket::request_type &req) {
                req.set(
                  boost::beast::http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " status-feed");
              }));
              ws_.text(true);

              ws_.async_handshake(host_str,
                path_str,
                [handler = std::move(handler)](const boost::system::error_code &ws_error) { handler(ws_error, 0); });
            });
        });
    });
}

auto websocket_stream::async_write(std::string_view message,
  std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void
{
  write_queue_.push_back(
    pending_write{ .message = std::make_shared<std::string>(message), .handler = std::move(handler) });

  // A write is already in flight; it picks this one up when it completes
  if (write_queue_.size() > 1) { return; }
  write_next();
}

auto websocket_stream::write_next() -> void
{
  if (write_queue_.empty()) { return; }

  auto message = write_queue_.front().message;
  ws_.async_write(boost::asio::buffer(*message),
    [this, message](const boost::system::error_code &error_code, std::size_t bytes_transferred) {
      auto handler = std::move(write_queue_.front().handler);
      write_queue_.pop_front();
      handler(error_code, bytes_transferred);
      write_next();
    });
}

auto websocket_stream::async_read(std::function<void(const boost::system::error_code &, std::string)> handler) -> void
{
  read_buffer_.clear();
  ws_.async_read(read_buffer_,
    [this, handler = std::move(handler)](const boost::system::error_code &error_code, std::size_t /*bytes_transferred*/) {
      if (error_code) {
        handler(error_code, {});
        return;
      }
      handler(error_code, boost::beast::buffers_to_string(read_buffer_.data()));
    });
}

auto websocket_stream::async_close(std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void
{
  ws_.async_close(boost::beast::websocket::close_code::normal,
    [handler = std::move(handler)](const boost::system::error_code &error_code) { handler(error_code, 0); });
}

}// namespace status_feed::transport
