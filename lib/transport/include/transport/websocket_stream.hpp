#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace nostr_pool::transport {

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
 * @brief WebSocket stream with TLS support.
 *
 * Provides asynchronous operations for secure WebSocket connections using Boost.Beast.
 * Every operation is initiated on the stream's own strand, so callers may start
 * them from any executor. Holders must keep the stream alive until all
 * outstanding handlers have run.
 */
class websocket_stream
{
public:
  using connection_params_t = websocket_connection_params;
  using handler_t = std::function<void(const boost::system::error_code &, std::size_t)>;
  using read_handler_t = std::function<void(const boost::system::error_code &, std::string)>;

  /**
   * @brief Constructs a WebSocket stream.
   *
   * @param io_context Boost.Asio io_context for async operations
   */
  explicit websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context);

  /**
   * @brief Resolves, connects, and performs the TLS and WebSocket handshakes.
   *
   * @param params Connection parameters (host, port, path)
   * @param handler Completion handler called with error code and 0
   */
  auto async_connect(websocket_connection_params params, handler_t handler) -> void;

  /**
   * @brief Writes one text message.
   *
   * @param data Message bytes (copied before returning)
   * @param handler Completion handler called with error code and bytes transferred
   */
  auto async_write(std::span<const std::byte> data, handler_t handler) -> void;

  /**
   * @brief Reads one whole message.
   *
   * @param handler Completion handler called with error code and the message text
   */
  auto async_read(read_handler_t handler) -> void;

  /**
   * @brief Sends a normal close frame and waits for the peer's.
   */
  auto async_close(handler_t handler) -> void;

private:
  static constexpr int connection_timeout_seconds = 30;

  boost::asio::ssl::context ssl_context_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>> ws_;
  boost::beast::flat_buffer read_buffer_;
};

}// namespace nostr_pool::transport
