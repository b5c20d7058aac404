#ifndef HTTPNTLM_COMMON_CONFIG_CREDENTIALS_H_
#define HTTPNTLM_COMMON_CONFIG_CREDENTIALS_H_

#include <string>

#include <nlohmann/json.hpp>

namespace httpntlm {
namespace config {

class Credentials {
 public:
  using Json = nlohmann::json;

 public:
  Credentials();

 public:
  void Update(const Json& credentials_prop);

  void Log() const;

  inline std::string domain() const { return domain_; }

  inline std::string username() const { return username_; }

  inline std::string password() const { return password_; }

  inline std::string workstation() const { return workstation_; }

 private:
  // User's domain
  std::string domain_;
  // Username
  std::string username_;
  // Password
  std::string password_;
  // Workstation name sent in the Authenticate message
  std::string workstation_;
};

}  // config
}  // httpntlm

#endif  // HTTPNTLM_COMMON_CONFIG_CREDENTIALS_H_
