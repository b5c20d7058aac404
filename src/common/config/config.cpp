#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

#include <httpntlm/error/error.h>
#include <httpntlm/log/log.h>

#include "common/config/config.h"

namespace httpntlm {
namespace config {

Config::Config() : credentials_(), transport_() {}

void Config::Init() {
  boost::system::error_code ec;

  HTTPNTLM_LOG("config", debug, "default configuration: {}", default_config_);

  UpdateFromString(default_config_, ec);
  if (ec) {
    HTTPNTLM_LOG("config", error, "could not load default configuration");
  }
}

void Config::UpdateFromFile(const std::string& filepath,
                            boost::system::error_code& ec) {
  std::string conf_file("config.json");
  ec.assign(::httpntlm::error::success,
            ::httpntlm::error::get_httpntlm_category());
  if (filepath.empty()) {
    std::ifstream ifile(conf_file);
    if (!ifile.good()) {
      return;
    }
  } else {
    conf_file = filepath;
  }

  HTTPNTLM_LOG("config", info, "loading file <{}>", conf_file);

  std::ifstream file(conf_file);
  if (!file.good()) {
    HTTPNTLM_LOG("config", error, "could not open config file <{}>",
                 conf_file);
    ec.assign(::httpntlm::error::invalid_argument,
              ::httpntlm::error::get_httpntlm_category());
    return;
  }

  try {
    Json config;
    file >> config;

    std::stringstream ss_loaded_config;
    ss_loaded_config << std::setw(4) << config;
    HTTPNTLM_LOG("config", debug, "custom configuration: {}",
                 ss_loaded_config.str());

    UpdateFromJson(config);
  } catch (const std::exception& e) {
    (void)(e);
    HTTPNTLM_LOG("config", error, "config file parsing error: {}", e.what());
    ec.assign(::httpntlm::error::invalid_argument,
              ::httpntlm::error::get_httpntlm_category());
  }
}

void Config::UpdateFromString(const std::string& config_string,
                              boost::system::error_code& ec) {
  ec.assign(::httpntlm::error::success,
            ::httpntlm::error::get_httpntlm_category());

  std::stringstream ss_config;
  ss_config << config_string;

  try {
    Json config;
    ss_config >> config;

    UpdateFromJson(config);
  } catch (const std::exception& e) {
    (void)(e);
    HTTPNTLM_LOG("config", error, "config string parsing error: {}",
                 e.what());
    ec.assign(::httpntlm::error::invalid_argument,
              ::httpntlm::error::get_httpntlm_category());
  }
}

void Config::Log() const {
  credentials_.Log();
  transport_.Log();
}

void Config::UpdateFromJson(const Json& json) {
  if (json.count("httpntlm") == 0) {
    return;
  }

  // sections are updated on copies so that a type error leaves the
  // configuration untouched
  Config updated(*this);
  auto httpntlm_config = json.at("httpntlm");
  updated.UpdateCredentials(httpntlm_config);
  updated.UpdateTransport(httpntlm_config);

  credentials_ = updated.credentials_;
  transport_ = updated.transport_;
}

void Config::UpdateCredentials(const Json& json) {
  if (json.count("credentials") == 0) {
    HTTPNTLM_LOG("config", debug, "update credentials: configuration not found");
    return;
  }

  credentials_.Update(json.at("credentials"));
}

void Config::UpdateTransport(const Json& json) {
  if (json.count("transport") == 0) {
    HTTPNTLM_LOG("config", debug, "update transport: configuration not found");
    return;
  }

  transport_.Update(json.at("transport"));
}

const char* Config::default_config_ = R"RAWSTRING(
{
  "httpntlm": {
    "credentials": {
      "domain": "",
      "username": "",
      "password": "",
      "workstation": ""
    },
    "transport": {
      "max_idle_connections_per_host": 2,
      "tls": {
        "verify_peer": true,
        "ca_file": ""
      }
    }
  }
}
)RAWSTRING";

}  // config
}  // httpntlm
