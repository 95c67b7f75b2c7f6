#pragma once

#include <boost/system/error_code.hpp>
#include <concepts>
#include <cstddef>
#include <functional>
#include <span>
#include <string>

namespace nostr_pool::concepts {

/**
 * @brief Concept defining the interface for message-oriented transport streams.
 *
 * Types satisfying this concept provide async connect, write, read and close for
 * one duplex connection. Each read completes with exactly one whole message.
 * Completion handlers may run on any thread; at most one write and one read
 * are outstanding at a time.
 *
 * Each stream type must define a `connection_params_t` type alias specifying the
 * connection parameters type it requires, constructible from
 * `{ .host, .port, .path }`.
 */
template<typename T>
concept transport_stream = requires(T &stream,
  typename T::connection_params_t params,
  const std::span<const std::byte> data,
  std::function<void(const boost::system::error_code &, std::size_t)> handler,
  std::function<void(const boost::system::error_code &, std::string)> read_handler) {
  typename T::connection_params_t;
  { stream.async_connect(params, handler) } -> std::same_as<void>;
  { stream.async_write(data, handler) } -> std::same_as<void>;
  { stream.async_read(read_handler) } -> std::same_as<void>;
  { stream.async_close(handler) } -> std::same_as<void>;
};

}// namespace nostr_pool::concepts
