#include <cstdint>
#include <fstream>
#include <stdexcept>

#include "rotftp/config.hpp"
#include "rotftp/exception.hpp"

using namespace rotftp;

static void check_range(int64_t value, const std::string &setting, int64_t min, int64_t max) {
  if (value < min || value > max) {
    throw invalid_config_exception(setting + " " + std::to_string(value) + " is out of range [" +
                                   std::to_string(min) + ", " + std::to_string(max) + "]");
  }
}

// Integer json value within [min, max]. Wrong type is left to nlohmann to report
static int64_t ranged(const json &value, const std::string &setting, int64_t min, int64_t max) {
  if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(max)) {
    throw invalid_config_exception(setting + " " + std::to_string(value.get<uint64_t>()) + " is out of range");
  }
  if (value.is_number_float()) {
    throw invalid_config_exception(setting + " must be an integer");
  }
  auto number = value.get<int64_t>();
  check_range(number, setting, min, max);
  return number;
}

int64_t rotftp::parse_number(const std::string &text, const std::string &setting, int64_t min, int64_t max) {
  std::size_t parsed = 0;
  int64_t number     = 0;
  try {
    number = std::stoll(text, &parsed);
  } catch (const std::logic_error &) {
    throw invalid_config_exception(setting + " '" + text + "' is not a number");
  }
  if (parsed != text.size()) {
    throw invalid_config_exception(setting + " '" + text + "' is not a number");
  }
  check_range(number, setting, min, max);
  return number;
}

server_conf::server_conf(const json &js) {
  for (auto &[key, value] : js.items()) {
    if (key == std::string("address")) {
      this->address = value.get<std::string>();
    } else if (key == std::string("port")) {
      // Port is accepted as "69" or 69
      this->port = value.is_number() ? std::to_string(ranged(value, key, 1, UINT16_MAX)) : value.get<std::string>();
    } else if (key == std::string("payload")) {
      this->payload_file = value.get<std::string>();
    } else if (key == std::string("retries")) {
      this->retries = static_cast<uint16_t>(ranged(value, key, 0, max_retries_setting));
    } else if (key == std::string("timeout_ms")) {
      this->timeout_ms = ranged(value, key, 0, max_timeout_ms_setting);
    } else if (key == std::string("max_transfers")) {
      this->max_transfers = static_cast<std::size_t>(ranged(value, key, 0, max_transfers_setting));
    } else {
      throw invalid_config_exception("Unknown server key :" + key);
    }
  }
}

conf::conf(std::string conf_file) : conf_file(conf_file) {
  std::ifstream conf_istrm(this->conf_file, std::ios::in);
  if (!conf_istrm.is_open()) {
    throw invalid_config_exception("Failed to open configuration file " + this->conf_file);
  }
  try {
    json conf_json;
    conf_istrm >> conf_json;
    for (auto &[key, value] : conf_json.items()) {
      if (key == std::string("server")) {
        this->server = server_conf(value);
      }
    }
  } catch (json::exception &e) {
    throw invalid_config_exception(this->conf_file + " :" + e.what());
  }
}
