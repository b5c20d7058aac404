#include <boost/algorithm/string.hpp>

#include <httpntlm/log/log.h>

#include "common/config/tls.h"

namespace httpntlm {
namespace config {

Tls::Tls() : verify_peer_(true), ca_file_("") {}

void Tls::Update(const Json& tls_prop) {
  if (tls_prop.count("verify_peer") == 1) {
    verify_peer_ = tls_prop.at("verify_peer").get<bool>();
  }

  if (tls_prop.count("ca_file") == 1) {
    ca_file_ = tls_prop.at("ca_file").get<std::string>();
    boost::trim(ca_file_);
  }
}

void Tls::Log() const {
  HTTPNTLM_LOG("config", info, "[tls] verify peer: <{}>",
               (verify_peer_ ? "true" : "false"));
  HTTPNTLM_LOG("config", info, "[tls] CA file: <{}>",
               (ca_file_.empty() ? "system" : ca_file_));
}

}  // config
}  // httpntlm
