#include <platform/env_utils.hpp>

#include <cstdlib>
#include <mutex>

#ifdef _WIN32
#include <memory>
#endif

namespace nostr_pool::platform {

auto get_home_directory() -> std::string
{
#ifdef _WIN32
  char *home_raw = nullptr;
  size_t len = 0;
  if (_dupenv_s(&home_raw, &len, "USERPROFILE") == 0 and home_raw != nullptr) {
    const std::unique_ptr<char, decltype(&free)> home(home_raw, &free);
    return { home.get() };
  }
  return "";
#else
  static std::mutex env_mutex;
  const std::scoped_lock lock(env_mutex);

  auto *home = std::getenv("HOME");// NOLINT(concurrency-mt-unsafe)
  return home != nullptr ? std::string(home) : "";
#endif
}

auto expand_tilde_path(const std::string &path) -> std::string
{
  if (path != "~" and not path.starts_with("~/")) { return path; }

  auto home = get_home_directory();
  if (home.empty()) { return path; }

  return home + path.substr(1);
}

}// namespace nostr_pool::platform
