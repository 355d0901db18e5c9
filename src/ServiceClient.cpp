#include "depotsync/ServiceClient.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/FstatCodec.hpp"
#include "httplib.h"
#include <cctype>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace depotsync {

// Helper for URL encoding
std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (char c : value) {
    // Keep alphanumeric and other safe characters
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~' || c == '/') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

namespace {
struct ProxyAddress {
  std::string host;
  int port = 0;
};

// "http://host:port" or "host:port"
std::optional<ProxyAddress> parseProxy(const std::string &url) {
  std::string rest = url;
  auto scheme = rest.find("://");
  if (scheme != std::string::npos)
    rest = rest.substr(scheme + 3);
  while (!rest.empty() && rest.back() == '/')
    rest.pop_back();
  auto colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0)
    return std::nullopt;
  try {
    return ProxyAddress{rest.substr(0, colon), std::stoi(rest.substr(colon + 1))};
  } catch (const std::exception &) {
    return std::nullopt;
  }
}
} // namespace

struct ServiceClient::Impl {
  httplib::Client client;
  Impl(const std::string &baseUrl, int timeoutSeconds) : client(baseUrl) {
    client.set_connection_timeout(timeoutSeconds, 0);
    client.set_read_timeout(timeoutSeconds, 0);
    client.set_write_timeout(timeoutSeconds, 0);
    client.set_follow_location(true);
  }
};

ServiceClient::ServiceClient(const std::string &baseUrl,
                             const std::string &username,
                             const std::string &password,
                             const std::string &proxyUrl, int timeoutSeconds)
    : m_baseUrl(baseUrl),
      m_impl(std::make_unique<Impl>(baseUrl, timeoutSeconds)) {
  if (!username.empty())
    m_impl->client.set_basic_auth(username, password);
  if (!proxyUrl.empty()) {
    auto proxy = parseProxy(proxyUrl);
    if (!proxy)
      throw ConfigError("Invalid proxy_url: " + proxyUrl);
    m_impl->client.set_proxy(proxy->host, proxy->port);
  }
}

ServiceClient::~ServiceClient() = default;

std::optional<QueryResponse> ServiceClient::fstat(const std::string &prefix,
                                                  int64_t from, int64_t to) {
  std::string path = "/depotsync/fstat?prefix=" + urlEncode(prefix) +
                     "&from=" + std::to_string(from) +
                     "&to=" + std::to_string(to);
  auto res = m_impl->client.Get(path.c_str());

  if (!res) {
    std::cerr << "[Query] Cache service unavailable ("
              << httplib::to_string(res.error()) << "), using the source"
              << std::endl;
    return std::nullopt;
  }
  if (res->status == 404)
    return std::nullopt;
  if (res->status != 200) {
    std::cerr << "[Query] Cache service answered status " << res->status
              << ", using the source" << std::endl;
    return std::nullopt;
  }

  json data;
  try {
    data = json::parse(res->body);
  } catch (const json::exception &e) {
    std::cerr << "[Query] JSON Parse Error: " << e.what() << std::endl;
    return std::nullopt;
  }

  QueryResponse response;
  try {
    std::string status = data.at("status").get<std::string>();
    if (status == "redirect") {
      response.status = QueryStatus::Redirect;
      response.redirectTo = data.at("redirect_to").get<int64_t>();
    } else if (status == "full") {
      response.status = QueryStatus::Full;
    } else {
      std::cerr << "[Query] Unknown cache status '" << status
                << "', using the source" << std::endl;
      return std::nullopt;
    }
    for (const auto &line : data.at("records"))
      response.records.push_back(FstatCodec::decode(line.get<std::string>()));
  } catch (const json::exception &e) {
    std::cerr << "[Query] Bad cache response: " << e.what() << std::endl;
    return std::nullopt;
  }

  if (response.status == QueryStatus::Redirect &&
      (response.redirectTo <= from || response.redirectTo >= to)) {
    throw RedirectViolation("Cache redirected " + prefix + " (" +
                            std::to_string(from) + "," + std::to_string(to) +
                            "] to " + std::to_string(response.redirectTo));
  }
  return response;
}

std::optional<std::vector<int64_t>>
ServiceClient::changelists(const std::string &prefix) {
  std::string path = "/depotsync/changelists?prefix=" + urlEncode(prefix);
  auto res = m_impl->client.Get(path.c_str());

  if (res && res->status == 200) {
    try {
      return json::parse(res->body).get<std::vector<int64_t>>();
    } catch (const std::exception &e) {
      std::cerr << "[Query] JSON Parse Error: " << e.what() << std::endl;
    }
  } else {
    std::cerr << "[Query] Request failed with status: "
              << (res ? res->status : -1) << std::endl;
  }
  return std::nullopt;
}

} // namespace depotsync
