#include "depotsync/Batcher.hpp"
#include "depotsync/FstatCodec.hpp"
#include <cstring>
#include <istream>
#include <utility>

namespace depotsync {

Batcher::Batcher(std::size_t cap, Weigher weigher)
    : m_cap(cap ? cap : 1), m_weigher(std::move(weigher)) {
  if (!m_weigher)
    m_weigher = &FstatCodec::weight;
}

bool Batcher::isSeparator(const std::string &line) {
  return line.compare(0, std::strlen(kSeparator), kSeparator) == 0;
}

std::optional<Batch> Batcher::add(FstatRecord record) {
  std::size_t weight = m_weigher(record);
  std::optional<Batch> closed;
  if (!m_current.records.empty() && m_current.bytes + weight > m_cap) {
    closed = std::move(m_current);
    m_current = Batch{};
  }
  m_current.records.push_back(std::move(record));
  m_current.bytes += weight;
  return closed;
}

std::optional<Batch> Batcher::flush() {
  if (m_current.records.empty())
    return std::nullopt;
  Batch batch = std::move(m_current);
  m_current = Batch{};
  return batch;
}

void Batcher::run(RecordChannel &in, BatchChannel &out) {
  while (auto record = in.pop()) {
    if (auto batch = add(std::move(*record))) {
      if (!out.push(std::move(*batch)))
        return;
    }
  }
  if (auto batch = flush())
    out.push(std::move(*batch));
}

void Batcher::run(std::istream &in, BatchChannel &out) {
  std::string line;
  while (std::getline(in, line)) {
    std::optional<Batch> batch;
    if (FstatCodec::isComment(line)) {
      if (isSeparator(line))
        batch = flush();
    } else {
      batch = add(FstatCodec::decode(line));
    }
    if (batch && !out.push(std::move(*batch)))
      return;
  }
  if (auto batch = flush())
    out.push(std::move(*batch));
}

} // namespace depotsync
