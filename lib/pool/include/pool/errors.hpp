#pragma once

#include <stdexcept>
#include <string>

namespace nostr_pool::pool {

/**
 * @brief Base of every caller-misuse error thrown by the pool.
 */
class pool_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

class relay_not_found : public pool_error
{
public:
  explicit relay_not_found(const std::string &url) : pool_error("Relay not found: " + url) {}
};

class subscription_not_found : public pool_error
{
public:
  explicit subscription_not_found(const std::string &subscription_id)
    : pool_error("Subscription not found: " + subscription_id)
  {}
};

class subscription_closed : public pool_error
{
public:
  explicit subscription_closed(const std::string &subscription_id)
    : pool_error("Subscription already closed: " + subscription_id)
  {}
};

class pool_shut_down : public pool_error
{
public:
  pool_shut_down() : pool_error("Relay pool has been shut down") {}
};

}// namespace nostr_pool::pool
