#pragma once

#include <negentropy/encoding.hpp>
#include <negentropy/storage.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nostr_pool::negentropy {

/**
 * @brief Range-based set reconciliation over a sealed storage.
 *
 * A client calls initiate() once and then feeds every reply into reconcile()
 * until it returns std::nullopt. A relay answers each message with respond().
 * The pending work lives in the messages themselves: every range either
 * matches (skip), is split into fingerprinted buckets, or is listed id by id,
 * so ranges shrink on every round until the exchange ends.
 *
 * Ids in @c have / @c need are raw 32-byte strings.
 */
class reconciler
{
public:
  /// Lower limit accepted for a non-zero frame size limit
  static constexpr std::size_t min_frame_size_limit = 4096;

  /**
   * @param storage Sealed storage; must outlive the reconciler
   * @param frame_size_limit Maximum message size in bytes, 0 for unlimited
   * @throws std::invalid_argument for a non-zero limit below min_frame_size_limit
   */
  explicit reconciler(const vector_storage &storage, std::size_t frame_size_limit = 0);

  /**
   * @brief Builds the opening message.
   *
   * @throws std::logic_error if called twice
   */
  [[nodiscard]] auto initiate() -> std::string;

  /**
   * @brief Processes a reply as the initiator.
   *
   * @param have Receives ids the local side has and the remote lacks
   * @param need Receives ids the remote has and the local side lacks
   * @return Next message to send, or std::nullopt when reconciliation is complete
   * @throws protocol_error on malformed input or an unsupported version
   */
  [[nodiscard]] auto reconcile(std::string_view query, std::vector<std::string> &have, std::vector<std::string> &need)
    -> std::optional<std::string>;

  /**
   * @brief Processes a message as the responder.
   *
   * @return Reply to send back
   * @throws protocol_error on malformed input
   */
  [[nodiscard]] auto respond(std::string_view query) -> std::string;

  [[nodiscard]] auto is_initiator() const -> bool { return initiator_; }

private:
  auto reconcile_ranges(std::string_view query, std::vector<std::string> &have, std::vector<std::string> &need)
    -> std::string;
  auto split_range(encoder &out, std::size_t lower, std::size_t upper, const bound &upper_bound) -> std::string;
  [[nodiscard]] auto exceeds_frame_limit(std::size_t size) const -> bool;

  const vector_storage &storage_;// NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
  std::size_t frame_size_limit_;
  bool initiator_{ false };
};

}// namespace nostr_pool::negentropy
