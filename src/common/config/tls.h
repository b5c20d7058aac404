#ifndef HTTPNTLM_COMMON_CONFIG_TLS_H_
#define HTTPNTLM_COMMON_CONFIG_TLS_H_

#include <string>

#include <nlohmann/json.hpp>

namespace httpntlm {
namespace config {

class Tls {
 public:
  using Json = nlohmann::json;

 public:
  Tls();

 public:
  void Update(const Json& tls_prop);

  void Log() const;

  bool verify_peer() const { return verify_peer_; }
  const std::string& ca_file() const { return ca_file_; }

 private:
  // Verify server certificate and host name
  bool verify_peer_;
  // CA certificates file, system trust store if empty
  std::string ca_file_;
};

}  // config
}  // httpntlm

#endif  // HTTPNTLM_COMMON_CONFIG_TLS_H_
