#pragma once
#include "Channel.hpp"
#include "types.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace depotsync {

using RecordChannel = Channel<FstatRecord>;

/**
 * A RecordStage consumes records from its input channel until the channel is
 * exhausted and writes what it forwards to its output channel. It must stop
 * when a push fails (the pipeline was cancelled). The pipeline closes the
 * output channel once run() returns.
 */
class RecordStage {
public:
  virtual ~RecordStage() = default;
  virtual std::string name() const = 0;
  virtual void run(RecordChannel &in, RecordChannel &out) = 0;
};

/**
 * Pipeline runs a chain of stages, each on its own thread, connected by
 * bounded channels. The first failing stage cancels every channel and its
 * exception is rethrown from run() after all threads are joined.
 */
class Pipeline {
public:
  using Producer = std::function<void(RecordChannel &)>;
  using Consumer = std::function<void(RecordChannel &)>;
  // Called on a stage's thread once it has drained its input, before its
  // output closes. Stages therefore report in chain order.
  using StageListener =
      std::function<void(std::size_t index, const RecordStage &stage)>;

  explicit Pipeline(std::size_t channelCapacity = 1024);
  ~Pipeline();

  Pipeline &add(std::unique_ptr<RecordStage> stage);

  template <typename S, typename... Args> S &emplace(Args &&...args) {
    auto stage = std::make_unique<S>(std::forward<Args>(args)...);
    S &ref = *stage;
    add(std::move(stage));
    return ref;
  }

  void onStageFinished(StageListener listener) {
    m_onFinished = std::move(listener);
  }

  std::size_t size() const { return m_stages.size(); }
  std::string describe() const;

  void run(const Producer &producer, const Consumer &consumer);
  RecordList run(RecordList input);
  void run(std::istream &in, std::ostream &out);

private:
  std::size_t m_capacity;
  std::vector<std::unique_ptr<RecordStage>> m_stages;
  StageListener m_onFinished;
};

} // namespace depotsync
