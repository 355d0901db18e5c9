#include "depotsync/FilterStage.hpp"
#include "depotsync/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace depotsync {

namespace {

struct PredicateName {
  Predicate predicate;
  const char *name;
};

const PredicateName kPredicateNames[] = {
    {Predicate::Checksum, "checksum"},
    {Predicate::Existence, "existence"},
    {Predicate::Deletes, "deletes"},
    {Predicate::HaveList, "havelist"},
    {Predicate::Case, "case"},
};

std::string foldCase(const std::string &text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

const char *modeName(FilterStage::Mode mode) {
  switch (mode) {
  case FilterStage::Mode::Drop:
    return "drop";
  case FilterStage::Mode::Keep:
    return "keep";
  case FilterStage::Mode::KeepAny:
    return "keep-any";
  }
  return "filter";
}

} // namespace

const char *toString(Predicate predicate) {
  for (const auto &entry : kPredicateNames) {
    if (entry.predicate == predicate)
      return entry.name;
  }
  return "unknown";
}

PredicateSpec parsePredicate(const std::string &arg) {
  if (arg.rfind("--", 0) != 0)
    throw ConfigError("Expected a predicate flag, got: " + arg);
  std::string name = arg.substr(2);
  bool inverted = false;
  if (name.rfind("not-", 0) == 0) {
    inverted = true;
    name = name.substr(4);
  }
  for (const auto &entry : kPredicateNames) {
    if (name == entry.name)
      return PredicateSpec{entry.predicate, inverted};
  }
  throw ConfigError("Unknown predicate: " + arg);
}

CaseFilter::CaseFilter(WorkspaceScanner &scanner, bool enabled)
    : m_scanner(scanner), m_enabled(enabled) {}

bool CaseFilter::accept(const FstatRecord &record) {
  if (!m_enabled)
    return true;
  auto key = foldCase(record.path);
  if (m_scanner.exists(record.path)) {
    m_seen.insert(key);
    return m_scanner.casefulAccurate(record.path);
  }
  return m_seen.insert(key).second;
}

FilterStage::FilterStage(Mode mode, std::vector<PredicateSpec> predicates,
                         FilterContext context)
    : m_mode(mode), m_predicates(std::move(predicates)), m_context(context) {
  if (m_predicates.empty())
    throw ConfigError(std::string(modeName(mode)) + " needs a predicate");
  for (const auto &p : m_predicates) {
    bool needsScanner = p.kind == Predicate::Checksum ||
                        p.kind == Predicate::Existence ||
                        p.kind == Predicate::Case;
    if (needsScanner && !m_context.scanner)
      throw ConfigError(std::string("--") + toString(p.kind) +
                        " needs a tracked directory");
    if (p.kind == Predicate::Case && !m_caseFilter)
      m_caseFilter.emplace(*m_context.scanner, m_context.caseInsensitive);
  }
}

std::string FilterStage::name() const {
  std::string text = modeName(m_mode);
  for (const auto &p : m_predicates) {
    text += p.inverted ? " --not-" : " --";
    text += toString(p.kind);
  }
  return text;
}

bool FilterStage::evaluate(const PredicateSpec &spec,
                           const FstatRecord &record) {
  bool result = false;
  switch (spec.kind) {
  case Predicate::Checksum:
    result = m_context.scanner->matchesChecksum(record);
    break;
  case Predicate::Existence:
    result = m_context.scanner->matchesExistence(record);
    break;
  case Predicate::Deletes:
    result = record.isDeletion();
    break;
  case Predicate::HaveList:
    if (m_context.state) {
      auto it = m_context.state->haveList.find(record.path);
      result = it != m_context.state->haveList.end() &&
               it->second.changelist >= record.change;
    }
    break;
  case Predicate::Case:
    result = m_caseFilter->accept(record);
    break;
  }
  return spec.inverted ? !result : result;
}

bool FilterStage::accept(const FstatRecord &record) {
  switch (m_mode) {
  case Mode::Drop:
    return std::none_of(
        m_predicates.begin(), m_predicates.end(),
        [&](const PredicateSpec &p) { return evaluate(p, record); });
  case Mode::Keep:
    return std::all_of(
        m_predicates.begin(), m_predicates.end(),
        [&](const PredicateSpec &p) { return evaluate(p, record); });
  case Mode::KeepAny:
    return std::any_of(
        m_predicates.begin(), m_predicates.end(),
        [&](const PredicateSpec &p) { return evaluate(p, record); });
  }
  return false;
}

void FilterStage::run(RecordChannel &in, RecordChannel &out) {
  while (auto record = in.pop()) {
    if (!accept(*record))
      continue;
    if (!out.push(std::move(*record)))
      return;
  }
}

ProgressStage::ProgressStage(std::string label, std::size_t interval,
                             Reporter reporter)
    : m_label(std::move(label)), m_interval(interval ? interval : 1),
      m_reporter(std::move(reporter)) {
  if (!m_reporter) {
    m_reporter = [](const std::string &label, std::size_t count,
                    bool finished) {
      std::cerr << "[Progress] " << label << ": " << count
                << (finished ? " records total" : " records") << std::endl;
    };
  }
}

void ProgressStage::run(RecordChannel &in, RecordChannel &out) {
  while (auto record = in.pop()) {
    ++m_count;
    if (m_count % m_interval == 0)
      m_reporter(m_label, m_count, false);
    if (!out.push(std::move(*record)))
      return;
  }
  m_reporter(m_label, m_count, true);
}

void FailStage::run(RecordChannel &in, RecordChannel & /*out*/) {
  std::vector<std::string> paths;
  std::size_t total = 0;
  while (auto record = in.pop()) {
    if (paths.size() < kMaxReportedPaths) {
      if (record->transferError)
        std::cerr << "[Pipeline] " << record->path << ": "
                  << *record->transferError << std::endl;
      paths.push_back(record->path);
    }
    ++total;
  }
  if (total > 0)
    throw VerificationFailure(std::move(paths), total);
}

} // namespace depotsync
