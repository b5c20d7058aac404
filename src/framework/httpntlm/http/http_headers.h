#ifndef HTTPNTLM_HTTP_HTTP_HEADERS_H_
#define HTTPNTLM_HTTP_HTTP_HEADERS_H_

#include <list>
#include <map>
#include <string>

#include <boost/algorithm/string/predicate.hpp>

namespace httpntlm {
namespace http {

// Header multimap with case insensitive names. Values of a repeated header
// keep their arrival order.
class HttpHeaders {
 private:
  struct NameLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const {
      return boost::algorithm::ilexicographical_compare(lhs, rhs);
    }
  };

 public:
  using Values = std::list<std::string>;
  using HeadersMap = std::map<std::string, Values, NameLess>;
  using const_iterator = HeadersMap::const_iterator;

 public:
  HttpHeaders();

  void Add(const std::string& name, const std::string& value);

  // Replaces every value of the header
  void Set(const std::string& name, const std::string& value);

  void Remove(const std::string& name);

  bool Has(const std::string& name) const;

  // First value or empty string
  std::string Get(const std::string& name) const;

  Values GetValues(const std::string& name) const;

  void Clear();

  inline bool empty() const { return headers_.empty(); }
  inline const_iterator begin() const { return headers_.begin(); }
  inline const_iterator end() const { return headers_.end(); }

 private:
  HeadersMap headers_;
};

}  // http
}  // httpntlm

#endif  // HTTPNTLM_HTTP_HTTP_HEADERS_H_
