/**
 * @file config.hpp
 * @brief Runtime settings: defaults, `config.json` in the state directory,
 *        then command-line overrides (applied by the CLI).
 *
 * @code
 *   {
 *     "api_url": "https://api.pushover.net/1",
 *     "push_url": "wss://client.pushover.net/push",
 *     "keepalive_interval_ms": 30000,
 *     "backoff_min_ms": 1000, "backoff_max_ms": 300000, "backoff_jitter": 0.2,
 *     "network_timeout_ms": 15000,
 *     "emergency_retry_s": 60, "emergency_expire_s": 10800,
 *     "device_name": "pushwire",
 *     "log_level": "info"
 *   }
 * @endcode
 * Every key is optional. Unknown keys are ignored.
 */
#ifndef PUSHWIRE_CONFIG_HPP
#define PUSHWIRE_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <string>

#include "pushwire/errors.hpp"
#include "pushwire/log.hpp"

namespace pushwire {

struct Config {
  std::string api_url{"https://api.pushover.net/1"};
  std::string push_url{"wss://client.pushover.net/push"};
  uint32_t    keepalive_interval_ms{30000};
  uint32_t    backoff_min_ms{1000};
  uint32_t    backoff_max_ms{300000};
  double      backoff_jitter{0.2};
  uint32_t    network_timeout_ms{15000};
  uint32_t    emergency_retry_s{60};
  uint32_t    emergency_expire_s{10800};
  std::string device_name{"pushwire"};
  log::Level  log_level{log::Level::Info};
};

/**
 * @brief Overlay `file` onto @p cfg.
 *
 * A missing file leaves @p cfg untouched and succeeds. Invalid JSON, a value
 * of the wrong type or an out-of-range number is StorageError naming the key.
 */
bool load_config(const std::filesystem::path& file, Config& cfg, Error& err);

} // namespace pushwire

#endif // PUSHWIRE_CONFIG_HPP
