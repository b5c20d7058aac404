#include "common/config/credentials.h"

#include <boost/algorithm/string.hpp>

#include <httpntlm/log/log.h>

namespace httpntlm {
namespace config {

Credentials::Credentials()
    : domain_(""), username_(""), password_(""), workstation_("") {}

void Credentials::Update(const Json& credentials_prop) {
  if (credentials_prop.count("domain") == 1) {
    domain_ = credentials_prop.at("domain").get<std::string>();
    boost::trim(domain_);
  }

  if (credentials_prop.count("username") == 1) {
    username_ = credentials_prop.at("username").get<std::string>();
    boost::trim(username_);
  }

  // password is kept as is
  if (credentials_prop.count("password") == 1) {
    password_ = credentials_prop.at("password").get<std::string>();
  }

  if (credentials_prop.count("workstation") == 1) {
    workstation_ = credentials_prop.at("workstation").get<std::string>();
    boost::trim(workstation_);
  }
}

void Credentials::Log() const {
  if (username_.empty()) {
    HTTPNTLM_LOG("config", info, "[credentials] <anonymous>");
    return;
  }

  if (domain_.empty()) {
    HTTPNTLM_LOG("config", info, "[credentials] username: <{}>", username_);
  } else {
    HTTPNTLM_LOG("config", info, "[credentials] username: <{}\\{}>", domain_,
                 username_);
  }
  if (!workstation_.empty()) {
    HTTPNTLM_LOG("config", info, "[credentials] workstation: <{}>",
                 workstation_);
  }
}

}  // config
}  // httpntlm
