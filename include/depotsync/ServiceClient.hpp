#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace depotsync {

/**
 * ServiceClient talks to the fstat cache service.
 * Uses cpp-httplib for networking and nlohmann/json for the message bodies.
 *
 * fstat() returns std::nullopt when the service has no usable entry or can
 * not be reached; the caller then asks the authoritative source. A redirect
 * outside the requested range raises RedirectViolation.
 */
class ServiceClient {
public:
  ServiceClient(const std::string &baseUrl, const std::string &username = "",
                const std::string &password = "",
                const std::string &proxyUrl = "", int timeoutSeconds = 10);
  ~ServiceClient();

  std::optional<QueryResponse> fstat(const std::string &prefix, int64_t from,
                                     int64_t to);
  std::optional<std::vector<int64_t>> changelists(const std::string &prefix);

  const std::string &baseUrl() const { return m_baseUrl; }

private:
  struct Impl;
  std::string m_baseUrl;
  std::unique_ptr<Impl> m_impl;
};

std::string urlEncode(const std::string &value);

} // namespace depotsync
