#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace status_feed::transport {

/**
 * @brief Parameters for establishing a WebSocket connection.
 */
struct websocket_connection_params
{
  std::string_view host;///< Hostname or IP address
  std::string_view port;///< Port number (typically "443" for wss://)
  std::string_view path;///< WebSocket path (e.g., "/" or "/api/v1")
};

/**
 * @brief Components of a relay URL.
 */
struct websocket_endpoint
{
  std::string host;
  std::string port;
  std::string path;
};

/**
 * @brief Splits a wss:// URL into host, port and path.
 *
 * @param url Relay URL such as "wss://relay.example.com:4443/nostr"
 * @return Endpoint, or std::nullopt for ws:// and other schemes
 */
[[nodiscard]] auto parse_websocket_url(std::string_view url) -> std::optional<websocket_endpoint>;

/**
 * @brief WebSocket stream with TLS support.
 *
 * Provides asynchronous operations for secure WebSocket connections using Boost.Beast.
 */
class websocket_stream
{
private:
  static constexpr int connection_timeout_seconds = 30;

  struct pending_write
  {
    std::shared_ptr<std::string> message;
    std::function<void(const boost::system::error_code &, std::size_t)> handler;
  };

  boost::asio::ssl::context ssl_context_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>> ws_;
  boost::beast::flat_buffer read_buffer_;
  std::deque<pending_write> write_queue_;

  auto write_next() -> void;

public:
  /**
   * @brief Constructs a WebSocket stream.
   *
   * @param io_context Boost.Asio io_context for async operations
   */
  explicit websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context);

  /**
   * @brief Asynchronously connects to a WebSocket endpoint.
   *
   * @param params Connection parameters (host, port, path)
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_connect(websocket_connection_params params,
    std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void;

  /**
   * @brief Queues a text message for writing.
   *
   * @param message Message to send, copied before returning
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_write(std::string_view message,
    std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void;

  /**
   * @brief Asynchronously reads one complete message.
   *
   * @param handler Completion handler called with error code and the message text
   */
  auto async_read(std::function<void(const boost::system::error_code &, std::string)> handler) -> void;

  /**
   * @brief Asynchronously closes the WebSocket connection.
   *
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_close(std::function<void(const boost::system::error_code &, std::size_t)> handler) -> void;
};

}// namespace status_feed::transport
