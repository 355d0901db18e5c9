#include "depotsync/Dispatcher.hpp"
#include "depotsync/FstatCodec.hpp"
#include <exception>
#include <iostream>
#include <istream>
#include <ostream>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace depotsync {

Dispatcher::Dispatcher(TransferExecutor &executor, TransferMode mode,
                       std::size_t workers)
    : m_executor(executor), m_mode(mode), m_workers(workers ? workers : 1) {}

bool Dispatcher::dispatch(Batch batch, RecordChannel &out) {
  TransferResult result;
  try {
    result = m_executor.execute(batch, m_mode);
  } catch (const std::exception &e) {
    result.success = false;
    result.message = e.what();
  }
  ++m_batches;
  m_records += batch.records.size();

  if (!result.success || !result.recordErrors.empty()) {
    ++m_failedBatches;
    if (result.recordErrors.empty()) {
      std::cerr << "[Dispatch] Batch of " << batch.records.size()
                << " record(s) failed: "
                << (result.message.empty() ? "transfer failed"
                                           : result.message)
                << std::endl;
    } else {
      std::cerr << "[Dispatch] " << result.recordErrors.size() << " of "
                << batch.records.size() << " record(s) failed" << std::endl;
    }
  }

  for (auto &record : batch.records) {
    record.transferError = result.errorFor(record.path);
    if (!out.push(std::move(record)))
      return false;
  }
  return true;
}

void Dispatcher::run(BatchChannel &in, RecordChannel &out) {
  std::mutex errorMutex;
  std::exception_ptr error;
  std::vector<std::thread> pool;

  for (std::size_t i = 0; i < m_workers; ++i) {
    pool.emplace_back([&]() {
      try {
        while (auto batch = in.pop()) {
          if (!dispatch(std::move(*batch), out)) {
            in.cancel();
            return;
          }
        }
      } catch (...) {
        // Non-std exceptions end the run: stop the other workers and
        // rethrow after the join.
        {
          std::lock_guard<std::mutex> lock(errorMutex);
          if (!error)
            error = std::current_exception();
        }
        in.cancel();
      }
    });
  }

  for (auto &t : pool)
    t.join();
  if (error)
    std::rethrow_exception(error);
}

TransferStage::TransferStage(TransferExecutor &executor, TransferMode mode,
                             std::size_t workers, std::size_t batchBytes)
    : m_mode(mode), m_batcher(batchBytes),
      m_dispatcher(executor, mode, workers) {}

std::string TransferStage::name() const {
  return m_mode == TransferMode::Force ? "transfer --force" : "transfer";
}

void TransferStage::run(RecordChannel &in, RecordChannel &out) {
  BatchChannel batches(m_dispatcher.workers() * 2);
  std::exception_ptr batcherError;

  std::thread batcherThread([&]() {
    try {
      m_batcher.run(in, batches);
      batches.close();
    } catch (...) {
      batcherError = std::current_exception();
      batches.cancel();
    }
  });

  std::exception_ptr dispatchError;
  try {
    m_dispatcher.run(batches, out);
  } catch (...) {
    dispatchError = std::current_exception();
    in.cancel();
  }
  // Releases the batcher if the workers stopped before draining.
  batches.cancel();
  batcherThread.join();

  if (dispatchError)
    std::rethrow_exception(dispatchError);
  if (batcherError)
    std::rethrow_exception(batcherError);
}

void TransferStage::run(std::istream &in, std::ostream &out) {
  BatchChannel batches(m_dispatcher.workers() * 2);
  RecordChannel results(m_dispatcher.workers() * 2);
  std::exception_ptr readError;
  std::exception_ptr dispatchError;

  std::thread reader([&]() {
    try {
      m_batcher.run(in, batches);
      batches.close();
    } catch (...) {
      readError = std::current_exception();
      batches.cancel();
    }
  });

  std::thread workers([&]() {
    try {
      m_dispatcher.run(batches, results);
      results.close();
    } catch (...) {
      dispatchError = std::current_exception();
      results.cancel();
      batches.cancel();
    }
  });

  while (auto record = results.pop())
    FstatCodec::write(out, *record);
  out.flush();
  // Releases the reader if the workers stopped before draining.
  batches.cancel();
  reader.join();
  workers.join();

  if (dispatchError)
    std::rethrow_exception(dispatchError);
  if (readError)
    std::rethrow_exception(readError);
}

} // namespace depotsync
