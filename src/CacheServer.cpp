#include "depotsync/CacheServer.hpp"
#include "depotsync/FstatCodec.hpp"
#include "httplib.h"
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace depotsync {

namespace {

std::string utcNow() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

bool parseChangelist(const httplib::Request &req, const char *name,
                     int64_t &value) {
  if (!req.has_param(name))
    return false;
  const std::string text = req.get_param_value(name);
  if (text.empty() || text.size() > 18)
    return false;
  value = 0;
  for (char c : text) {
    if (c < '0' || c > '9')
      return false;
    value = value * 10 + (c - '0');
  }
  return true;
}

void badRequest(httplib::Response &res, const std::string &message) {
  res.status = 400;
  res.set_content(json{{"error", message}}.dump(), "application/json");
}

} // namespace

struct CacheServer::Impl {
  CacheService &service;
  std::ostream &accessLog;
  std::mutex logMutex;
  httplib::Server server;

  Impl(CacheService &s, std::ostream &log) : service(s), accessLog(log) {
    server.Get("/depotsync/fstat",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handleFstat(req, res);
               });
    server.Get("/depotsync/changelists",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handleChangelists(req, res);
               });
    server.set_exception_handler([this](const httplib::Request &req,
                                        httplib::Response &res,
                                        std::exception_ptr ep) {
      std::string message = "internal error";
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception &e) {
        message = e.what();
      }
      std::cerr << "[Server] " << req.path << " failed: " << message
                << std::endl;
      res.status = 500;
      res.set_content(json{{"error", message}}.dump(), "application/json");
    });
  }

  void logRequest(const std::string &op, const std::string &object,
                  std::chrono::steady_clock::time_point start,
                  int64_t redirect = 0) {
    double elapsed = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - start)
                         .count();
    std::lock_guard<std::mutex> lock(logMutex);
    accessLog << utcNow() << " op=" << op << " object=" << object
              << " elapsed=" << std::fixed << std::setprecision(3) << elapsed;
    if (redirect)
      accessLog << " redir=" << redirect;
    accessLog << std::endl;
  }

  void handleFstat(const httplib::Request &req, httplib::Response &res) {
    auto start = std::chrono::steady_clock::now();
    int64_t from = 0, to = 0;
    if (!req.has_param("prefix") || req.get_param_value("prefix").empty())
      return badRequest(res, "prefix is required");
    if (!parseChangelist(req, "from", from) ||
        !parseChangelist(req, "to", to))
      return badRequest(res, "from and to must be changelist numbers");
    const std::string prefix = req.get_param_value("prefix");

    auto answer = service.query(prefix, from, to);
    json body;
    switch (answer.outcome) {
    case CacheOutcome::Miss:
      res.status = 404;
      res.set_content(json{{"status", "miss"}}.dump(), "application/json");
      logRequest("fstat", prefix + "@" + std::to_string(to), start);
      return;
    case CacheOutcome::Full:
      body["status"] = "full";
      break;
    case CacheOutcome::Redirect:
      body["status"] = "redirect";
      body["redirect_to"] = answer.redirectTo;
      break;
    }
    json lines = json::array();
    for (const auto &record : answer.records)
      lines.push_back(FstatCodec::encode(record));
    body["records"] = std::move(lines);

    res.status = 200;
    res.set_content(body.dump(), "application/json");
    logRequest("fstat", prefix + "@" + std::to_string(to), start,
               answer.outcome == CacheOutcome::Redirect ? answer.redirectTo
                                                        : 0);
  }

  void handleChangelists(const httplib::Request &req, httplib::Response &res) {
    auto start = std::chrono::steady_clock::now();
    if (!req.has_param("prefix") || req.get_param_value("prefix").empty())
      return badRequest(res, "prefix is required");
    const std::string prefix = req.get_param_value("prefix");

    auto changelists = service.changelists(prefix);
    if (req.get_header_value("Accept") == "text/plain") {
      std::string body;
      for (auto cl : changelists)
        body += std::to_string(cl) + "\n";
      res.set_content(body, "text/plain");
    } else {
      res.set_content(json(changelists).dump(), "application/json");
    }
    res.set_header("Cache-Control", "no-cache");
    logRequest("get_changelists", prefix, start);
  }
};

CacheServer::CacheServer(CacheService &service)
    : m_impl(std::make_unique<Impl>(service, std::cout)) {}

CacheServer::CacheServer(CacheService &service, std::ostream &accessLog)
    : m_impl(std::make_unique<Impl>(service, accessLog)) {}

CacheServer::~CacheServer() { stop(); }

bool CacheServer::listen(const std::string &host, int port) {
  std::cout << "[Server] Listening on " << host << ":" << port << std::endl;
  return m_impl->server.listen(host, port);
}

int CacheServer::bindToAnyPort(const std::string &host) {
  return m_impl->server.bind_to_any_port(host);
}

bool CacheServer::listenAfterBind() {
  return m_impl->server.listen_after_bind();
}

void CacheServer::stop() {
  if (m_impl->server.is_running())
    m_impl->server.stop();
}

bool CacheServer::isRunning() const { return m_impl->server.is_running(); }

} // namespace depotsync
