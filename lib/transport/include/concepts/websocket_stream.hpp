#pragma once

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace status_feed::transport {
struct websocket_connection_params;
}

namespace status_feed::concepts {

/**
 * @brief Concept for a message-oriented WebSocket stream.
 *
 * Reads complete with one whole text message. Writes may be issued while an earlier write is still
 * in flight; the stream sends them in order.
 */
template<typename T>
concept websocket_stream = requires(T &stream,
  const transport::websocket_connection_params params,
  std::string_view message,
  std::function<void(const boost::system::error_code &, std::size_t)> handler,
  std::function<void(const boost::system::error_code &, std::string)> read_handler) {
  { stream.async_connect(params, handler) } -> std::same_as<void>;
  { stream.async_write(message, handler) } -> std::same_as<void>;
  { stream.async_read(read_handler) } -> std::same_as<void>;
  { stream.async_close(handler) } -> std::same_as<void>;
};

}// namespace status_feed::concepts
