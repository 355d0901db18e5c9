#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace depotsync {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A line of the record stream could not be decoded, or a record can not be
// encoded (newline in path).
class MalformedRecord : public Error {
public:
  MalformedRecord(const std::string &reason, const std::string &line)
      : Error("Malformed fstat record (" + reason + "): " + line),
        m_line(line) {}
  const std::string &line() const { return m_line; }

private:
  std::string m_line;
};

// Records reached the terminal fail stage.
class VerificationFailure : public Error {
public:
  VerificationFailure(std::vector<std::string> paths, std::size_t total);
  const std::vector<std::string> &paths() const { return m_paths; }
  std::size_t total() const { return m_total; }

private:
  std::vector<std::string> m_paths;
  std::size_t m_total;
};

// The cache service answered a redirect outside (from, to).
class RedirectViolation : public Error {
public:
  using Error::Error;
};

class ConfigError : public Error {
public:
  using Error::Error;
};

// The authoritative fstat source failed to answer.
class SourceError : public Error {
public:
  using Error::Error;
};

class StateError : public Error {
public:
  using Error::Error;
};

} // namespace depotsync
