#include "depotsync/FstatCodec.hpp"
#include "depotsync/Errors.hpp"
#include <cctype>
#include <istream>
#include <ostream>
#include <sstream>
#include <vector>

namespace depotsync {

namespace {

std::vector<std::string> splitColumns(const std::string &line) {
  std::vector<std::string> columns;
  std::string item;
  std::stringstream ss(line);
  while (std::getline(ss, item, ','))
    columns.push_back(item);
  // getline drops a trailing empty column ("...,digest," has 8 columns)
  if (!line.empty() && line.back() == ',')
    columns.emplace_back();
  return columns;
}

int64_t parseCanonical(const std::string &text, const char *column,
                       const std::string &line) {
  if (text.size() > 1 && text[0] == '0')
    throw MalformedRecord(std::string("non-canonical ") + column, line);
  auto value = FstatCodec::parseNumber(text);
  if (!value)
    throw MalformedRecord(std::string("bad ") + column, line);
  return *value;
}

// Depot-relative paths never climb out of the tracked directory.
bool escapesRoot(const std::string &path) {
  if (path[0] == '/')
    return true;
  std::stringstream ss(path);
  std::string part;
  while (std::getline(ss, part, '/')) {
    if (part == "..")
      return true;
  }
  return false;
}

bool hasLineBreak(const std::string &text) {
  return text.find('\n') != std::string::npos ||
         text.find('\r') != std::string::npos;
}

} // namespace

std::string FstatCodec::escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == ';')
      out += ";;";
    else if (c == ',')
      out += ";.";
    else
      out += c;
  }
  return out;
}

std::string FstatCodec::unescape(const std::string &text,
                                 const std::string &line) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != ';') {
      out += text[i];
      continue;
    }
    if (i + 1 >= text.size())
      throw MalformedRecord("dangling escape", line);
    char next = text[++i];
    if (next == ';')
      out += ';';
    else if (next == '.')
      out += ',';
    else
      throw MalformedRecord("bad escape", line);
  }
  return out;
}

bool FstatCodec::isComment(const std::string &line) {
  return !line.empty() && line[0] == '#';
}

void FstatCodec::validate(const FstatRecord &record) {
  if (record.path.empty())
    throw MalformedRecord("empty path", std::to_string(record.change));
  if (hasLineBreak(record.path))
    throw MalformedRecord("line break in path", record.path);
  if (escapesRoot(record.path))
    throw MalformedRecord("path outside the tracked directory", record.path);
  if (record.change < 1 || record.revision < 0 || record.size < 0)
    throw MalformedRecord("negative number", record.path);
  if (!record.digest.empty() && record.digest.size() != kDigestLength)
    throw MalformedRecord("digest length", record.path);
  for (const auto &e : record.extra) {
    if (e.find(',') != std::string::npos || hasLineBreak(e))
      throw MalformedRecord("bad extra column", record.path);
  }
  if (!record.transferError && !record.extra.empty() &&
      !record.extra.back().empty() && record.extra.back()[0] == '!')
    throw MalformedRecord("extra column looks like an annotation",
                          record.path);
  if (record.transferError && hasLineBreak(*record.transferError))
    throw MalformedRecord("line break in annotation", record.path);
}

std::string FstatCodec::encode(const FstatRecord &record) {
  validate(record);
  std::string line = std::to_string(record.change) + "," +
                     escape(record.path) + "," +
                     std::to_string(record.revision) + "," +
                     toString(record.action) + "," + record.fileType + "," +
                     std::to_string(record.size) + "," + record.digest;
  for (const auto &e : record.extra)
    line += "," + e;
  if (record.transferError)
    line += ",!" + escape(*record.transferError);
  return line;
}

FstatRecord FstatCodec::decode(const std::string &line) {
  if (line.empty())
    throw MalformedRecord("empty line", line);
  if (hasLineBreak(line))
    throw MalformedRecord("line break", line);

  auto columns = splitColumns(line);
  if (columns.size() < kFixedColumns)
    throw MalformedRecord("too few columns", line);

  FstatRecord record;
  record.change = parseCanonical(columns[0], "change", line);
  if (record.change < 1)
    throw MalformedRecord("change must be positive", line);
  record.path = unescape(columns[1], line);
  if (record.path.empty())
    throw MalformedRecord("empty path", line);
  record.revision = parseCanonical(columns[2], "revision", line);

  auto action = actionFromString(columns[3]);
  if (!action)
    throw MalformedRecord("unknown action", line);
  record.action = *action;

  record.fileType = columns[4];
  if (record.fileType.empty())
    throw MalformedRecord("empty type", line);
  record.size = parseCanonical(columns[5], "size", line);

  record.digest = columns[6];
  if (!record.digest.empty()) {
    if (record.digest.size() != kDigestLength)
      throw MalformedRecord("digest length", line);
    for (char c : record.digest) {
      if (!std::isxdigit(static_cast<unsigned char>(c)))
        throw MalformedRecord("digest not hex", line);
    }
  }

  std::size_t end = columns.size();
  if (end > kFixedColumns && !columns.back().empty() &&
      columns.back()[0] == '!') {
    record.transferError = unescape(columns.back().substr(1), line);
    --end;
  }
  for (std::size_t i = kFixedColumns; i < end; ++i)
    record.extra.push_back(columns[i]);
  validate(record);
  return record;
}

std::size_t FstatCodec::weight(const FstatRecord &record) {
  return encode(record).size() + 1;
}

std::optional<int64_t> FstatCodec::parseNumber(const std::string &text) {
  if (text.empty() || text.size() > 18)
    return std::nullopt;
  int64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return std::nullopt;
    value = value * 10 + (c - '0');
  }
  return value;
}

std::optional<FstatRecord> FstatCodec::read(std::istream &in) {
  std::string line;
  while (std::getline(in, line)) {
    if (isComment(line))
      continue;
    return decode(line);
  }
  return std::nullopt;
}

void FstatCodec::write(std::ostream &out, const FstatRecord &record) {
  out << encode(record) << '\n';
}

} // namespace depotsync
