#pragma once
#include "Pipeline.hpp"
#include "WorkspaceScanner.hpp"
#include "types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace depotsync {

enum class Predicate { Checksum, Existence, Deletes, HaveList, Case };

struct PredicateSpec {
  Predicate kind;
  bool inverted = false;
};

// What the predicates look at besides the record itself.
struct FilterContext {
  WorkspaceScanner *scanner = nullptr;
  const LocalState *state = nullptr;
  bool caseInsensitive = false;
};

const char *toString(Predicate predicate);

// Parses "--checksum", "--not-checksum", ... Throws ConfigError on anything
// else.
PredicateSpec parsePredicate(const std::string &arg);

/**
 * CaseFilter keeps one spelling per case-folded path. A record whose path
 * exists locally survives only if the local spelling matches exactly; a
 * record for a missing path survives only if it is the first of its key.
 * When the filesystem is case-sensitive every record survives.
 */
class CaseFilter {
public:
  CaseFilter(WorkspaceScanner &scanner, bool enabled);
  bool accept(const FstatRecord &record);

private:
  WorkspaceScanner &m_scanner;
  bool m_enabled;
  std::set<std::string> m_seen;
};

/**
 * FilterStage forwards or drops each record by evaluating a list of
 * predicates:
 *   Drop    - forward records matching none of them
 *   Keep    - forward records matching all of them
 *   KeepAny - forward records matching at least one
 */
class FilterStage : public RecordStage {
public:
  enum class Mode { Drop, Keep, KeepAny };

  FilterStage(Mode mode, std::vector<PredicateSpec> predicates,
              FilterContext context);

  std::string name() const override;
  void run(RecordChannel &in, RecordChannel &out) override;

  bool accept(const FstatRecord &record);

private:
  Mode m_mode;
  std::vector<PredicateSpec> m_predicates;
  FilterContext m_context;
  std::optional<CaseFilter> m_caseFilter;

  bool evaluate(const PredicateSpec &spec, const FstatRecord &record);
};

/**
 * ProgressStage forwards every record unchanged and reports the running
 * count every `interval` records, plus the total once the input ends.
 */
class ProgressStage : public RecordStage {
public:
  using Reporter =
      std::function<void(const std::string &label, std::size_t count,
                         bool finished)>;

  ProgressStage(std::string label, std::size_t interval,
                Reporter reporter = nullptr);

  std::string name() const override { return "progress"; }
  void run(RecordChannel &in, RecordChannel &out) override;

  std::size_t count() const { return m_count; }

private:
  std::string m_label;
  std::size_t m_interval;
  Reporter m_reporter;
  std::size_t m_count = 0;
};

// Terminal stage: any record reaching it fails the run.
class FailStage : public RecordStage {
public:
  static constexpr std::size_t kMaxReportedPaths = 100;

  std::string name() const override { return "fail"; }
  void run(RecordChannel &in, RecordChannel &out) override;
};

} // namespace depotsync
