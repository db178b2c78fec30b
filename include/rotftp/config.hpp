#ifndef __ROTFTP_CONFIG_HPP__
#define __ROTFTP_CONFIG_HPP__
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "rotftp/project_config.hpp"

namespace rotftp {
using json = nlohmann::json;

class conf;
typedef std::shared_ptr<conf> conf_s;

// Accepted ranges of numeric settings
constexpr int64_t max_retries_setting       = UINT16_MAX;
constexpr int64_t max_timeout_ms_setting    = 24 * 60 * 60 * 1000;
constexpr int64_t max_transfers_setting     = INT32_MAX;

/* Parses text as a decimal integer within [min, max]. Throws invalid_config_exception naming the setting
 * if text isn't a number or is out of range, values are never wrapped.
 */
int64_t parse_number(const std::string &text, const std::string &setting, int64_t min, int64_t max);

/* Server section of configuration file. Every key is optional
 *  {
 *    "server": {
 *      "address": "0.0.0.0",
 *      "port": "69",
 *      "payload": "/srv/tftp/image.bin",
 *      "retries": 10,
 *      "timeout_ms": 6000,
 *      "max_transfers": 0
 *    }
 *  }
 * Zero retries or timeout leave the choice to server defaults.
 */
class server_conf {
public:
  server_conf() = default;
  server_conf(const json &js);

  std::string address  = "0.0.0.0";
  std::string port     = ROTFTP_CONF_DEFAULT_PORT;
  std::string payload_file;
  uint16_t retries          = 0;
  int64_t timeout_ms        = 0;
  std::size_t max_transfers = 0;
};

/* Loads configuration file. Throws invalid_config_exception if file can't be read, isn't json or a key
 * holds a value of wrong type
 */
class conf {
public:
  conf(std::string conf_file);
  const std::string conf_file;
  server_conf server;
};

} // namespace rotftp

#endif
