#pragma once
#include "Batcher.hpp"
#include "Pipeline.hpp"
#include "types.hpp"
#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace depotsync {

/**
 * TransferExecutor moves the files of one batch into the tracked directory.
 * The result carries an outcome per record: failures it can pin on a path go
 * in recordErrors, anything else fails the whole batch. A thrown
 * std::exception fails the whole batch too.
 */
class TransferExecutor {
public:
  virtual ~TransferExecutor() = default;
  virtual TransferResult execute(const Batch &batch, TransferMode mode) = 0;
};

/**
 * Dispatcher runs a fixed pool of workers that take batches from one shared
 * channel and hand each to the executor. Every record of a batch is
 * forwarded afterwards, annotated with its own failure reason if it has one.
 * Order is kept within a batch only.
 */
class Dispatcher {
public:
  static constexpr std::size_t kDefaultWorkers = 4;

  Dispatcher(TransferExecutor &executor, TransferMode mode,
             std::size_t workers = kDefaultWorkers);

  // Returns once `in` is exhausted and every worker has finished.
  void run(BatchChannel &in, RecordChannel &out);

  std::size_t workers() const { return m_workers; }
  std::size_t batches() const { return m_batches; }
  std::size_t failedBatches() const { return m_failedBatches; }
  std::size_t records() const { return m_records; }

private:
  TransferExecutor &m_executor;
  TransferMode m_mode;
  std::size_t m_workers;
  std::atomic<std::size_t> m_batches{0};
  std::atomic<std::size_t> m_failedBatches{0};
  std::atomic<std::size_t> m_records{0};

  bool dispatch(Batch batch, RecordChannel &out);
};

// Batcher and Dispatcher combined into one pipeline stage.
class TransferStage : public RecordStage {
public:
  TransferStage(TransferExecutor &executor, TransferMode mode,
                std::size_t workers = Dispatcher::kDefaultWorkers,
                std::size_t batchBytes = Batcher::kDefaultCap);

  std::string name() const override;
  void run(RecordChannel &in, RecordChannel &out) override;
  // Transfers a record stream, keeping the batches a manifold stream marks.
  void run(std::istream &in, std::ostream &out);

  std::size_t records() const { return m_dispatcher.records(); }
  const Dispatcher &dispatcher() const { return m_dispatcher; }

private:
  TransferMode m_mode;
  Batcher m_batcher;
  Dispatcher m_dispatcher;
};

} // namespace depotsync
