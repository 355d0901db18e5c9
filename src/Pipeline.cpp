#include "depotsync/Pipeline.hpp"
#include "depotsync/FstatCodec.hpp"
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>

namespace depotsync {

namespace {

class FailureLatch {
public:
  explicit FailureLatch(std::vector<std::unique_ptr<RecordChannel>> &channels)
      : m_channels(channels) {}

  void fail(std::exception_ptr error, const std::string &where) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_error)
        return;
      m_error = error;
      m_where = where;
    }
    for (auto &ch : m_channels)
      ch->cancel();
  }

  void rethrowIfFailed() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_error) {
      try {
        std::rethrow_exception(m_error);
      } catch (const std::exception &e) {
        std::cerr << "[Pipeline] Stage '" << m_where << "' failed: " << e.what()
                  << std::endl;
        throw;
      }
    }
  }

private:
  std::vector<std::unique_ptr<RecordChannel>> &m_channels;
  std::mutex m_mutex;
  std::exception_ptr m_error;
  std::string m_where;
};

} // namespace

Pipeline::Pipeline(std::size_t channelCapacity) : m_capacity(channelCapacity) {}

Pipeline::~Pipeline() = default;

Pipeline &Pipeline::add(std::unique_ptr<RecordStage> stage) {
  m_stages.push_back(std::move(stage));
  return *this;
}

std::string Pipeline::describe() const {
  std::string text;
  for (const auto &stage : m_stages) {
    if (!text.empty())
      text += " | ";
    text += stage->name();
  }
  return text;
}

void Pipeline::run(const Producer &producer, const Consumer &consumer) {
  std::vector<std::unique_ptr<RecordChannel>> channels;
  for (std::size_t i = 0; i <= m_stages.size(); ++i)
    channels.push_back(std::make_unique<RecordChannel>(m_capacity));

  FailureLatch latch(channels);
  std::vector<std::thread> threads;

  threads.emplace_back([&]() {
    try {
      producer(*channels.front());
      channels.front()->close();
    } catch (...) {
      latch.fail(std::current_exception(), "input");
    }
  });

  for (std::size_t i = 0; i < m_stages.size(); ++i) {
    threads.emplace_back([&, i]() {
      RecordStage &stage = *m_stages[i];
      try {
        stage.run(*channels[i], *channels[i + 1]);
        if (m_onFinished && !channels[i + 1]->cancelled())
          m_onFinished(i, stage);
        channels[i + 1]->close();
      } catch (...) {
        latch.fail(std::current_exception(), stage.name());
      }
    });
  }

  try {
    consumer(*channels.back());
  } catch (...) {
    latch.fail(std::current_exception(), "output");
  }
  // An early-returning consumer must not leave upstream stages blocked.
  channels.back()->cancel();

  for (auto &t : threads)
    t.join();
  latch.rethrowIfFailed();
}

RecordList Pipeline::run(RecordList input) {
  RecordList output;
  run(
      [&input](RecordChannel &out) {
        for (auto &record : input) {
          if (!out.push(std::move(record)))
            return;
        }
      },
      [&output](RecordChannel &in) {
        while (auto record = in.pop())
          output.push_back(std::move(*record));
      });
  return output;
}

void Pipeline::run(std::istream &in, std::ostream &out) {
  run(
      [&in](RecordChannel &channel) {
        while (auto record = FstatCodec::read(in)) {
          if (!channel.push(std::move(*record)))
            return;
        }
      },
      [&out](RecordChannel &channel) {
        while (auto record = channel.pop())
          FstatCodec::write(out, *record);
        out.flush();
      });
}

} // namespace depotsync
