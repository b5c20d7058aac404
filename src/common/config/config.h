#ifndef HTTPNTLM_COMMON_CONFIG_CONFIG_H_
#define HTTPNTLM_COMMON_CONFIG_CONFIG_H_

#include <string>

#include <boost/system/error_code.hpp>

#include <nlohmann/json.hpp>

#include "common/config/credentials.h"
#include "common/config/transport.h"

namespace httpntlm {
namespace config {

class Config {
 public:
  using Json = nlohmann::json;

 public:
  Config();

 public:
  /**
   * Initialize config with default values
   * Format example (default values):
   * {
   *   "httpntlm": {
   *     "credentials": {
   *       "domain": "",
   *       "username": "",
   *       "password": "",
   *       "workstation": ""
   *     },
   *     "transport": {
   *       "max_idle_connections_per_host": 2,
   *       "tls": {
   *         "verify_peer": true,
   *         "ca_file": ""
   *       }
   *     }
   *   }
   * }
   */
  void Init();

  /**
   * Update configuration with JSON file
   * If no file provided, try to load config from "config.json" file
   * @param filepath config filepath (relative or absolute)
   * @param ec error code set if update failed
   */
  void UpdateFromFile(const std::string& filepath,
                      boost::system::error_code& ec);

  /**
   * Update configuration from JSON string
   * @param config_string
   * @param ec error code set if update failed
   */
  void UpdateFromString(const std::string& config_string,
                        boost::system::error_code& ec);

  /**
   * Log configuration (password excluded)
   */
  void Log() const;

  const Credentials& credentials() const { return credentials_; }
  Credentials& credentials() { return credentials_; }

  const Transport& transport() const { return transport_; }
  Transport& transport() { return transport_; }

 private:
  void UpdateFromJson(const Json& json);
  void UpdateCredentials(const Json& json);
  void UpdateTransport(const Json& json);

 private:
  static const char* default_config_;
  Credentials credentials_;
  Transport transport_;
};

}  // config
}  // httpntlm

#endif  // HTTPNTLM_COMMON_CONFIG_CONFIG_H_
