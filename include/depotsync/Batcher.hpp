#pragma once
#include "Pipeline.hpp"
#include "types.hpp"
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace depotsync {

using BatchChannel = Channel<Batch>;

/**
 * Batcher groups the record stream into batches whose cumulative weight stays
 * within a byte cap. A record heavier than the cap travels alone. Batch
 * boundaries depend only on the record weights and their order.
 */
class Batcher {
public:
  using Weigher = std::function<std::size_t(const FstatRecord &)>;

  static constexpr std::size_t kDefaultCap = 10 * 1024 * 1024;
  // Comment line that starts a batch in a manifold stream.
  static constexpr const char *kSeparator = "# batch";

  static bool isSeparator(const std::string &line);

  explicit Batcher(std::size_t cap = kDefaultCap, Weigher weigher = nullptr);

  // Adds a record; returns the previous batch if this record closed it.
  std::optional<Batch> add(FstatRecord record);
  // Returns the pending batch, if any.
  std::optional<Batch> flush();

  // Drains `in`, pushing every batch to `out`. Does not close `out`.
  void run(RecordChannel &in, BatchChannel &out);
  // Same for a record stream. Separator lines close the pending batch, so
  // the boundaries of a manifold stream are kept; the cap still applies.
  void run(std::istream &in, BatchChannel &out);

  std::size_t cap() const { return m_cap; }

private:
  std::size_t m_cap;
  Weigher m_weigher;
  Batch m_current;
};

} // namespace depotsync
