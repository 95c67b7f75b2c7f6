#include <core/id_generator.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <fmt/format.h>

namespace nostr_pool::core {

auto id_generator::subscription_id() -> std::string
{
  static thread_local boost::uuids::random_generator gen;
  const boost::uuids::uuid uuid = gen();

  std::string hex;
  hex.reserve(boost::uuids::uuid::static_size() * 2);
  for (const auto byte : uuid) { hex += fmt::format("{:02x}", byte); }
  return hex;
}

auto id_generator::prefixed_id(const std::string &prefix) -> std::string { return prefix + subscription_id(); }

}// namespace nostr_pool::core
