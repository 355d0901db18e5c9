#pragma once
#include "CacheService.hpp"
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace depotsync {

/**
 * CacheServer exposes a CacheService over HTTP:
 *
 *   GET /depotsync/fstat?prefix=<p>&from=<a>&to=<b>
 *       200 {"status":"full","records":[...]}
 *       200 {"status":"redirect","redirect_to":R,"records":[...]}
 *       404 {"status":"miss"}
 *   GET /depotsync/changelists?prefix=<p>
 *       200 [cl, ...] (newline separated with Accept: text/plain)
 *
 * Every request is logged as one line to the access log.
 */
class CacheServer {
public:
  explicit CacheServer(CacheService &service);
  CacheServer(CacheService &service, std::ostream &accessLog);
  ~CacheServer();

  // Blocks until stop().
  bool listen(const std::string &host, int port);

  // Binds an ephemeral port and returns it (-1 on failure); serve with
  // listenAfterBind().
  int bindToAnyPort(const std::string &host);
  bool listenAfterBind();

  void stop();
  bool isRunning() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace depotsync
