#include "depotsync/Batcher.hpp"
#include "depotsync/CommandTransferExecutor.hpp"
#include "depotsync/Config.hpp"
#include "depotsync/Dispatcher.hpp"
#include "depotsync/Errors.hpp"
#include "depotsync/FilterStage.hpp"
#include "depotsync/FstatCache.hpp"
#include "depotsync/FstatCodec.hpp"
#include "depotsync/FstatQuery.hpp"
#include "depotsync/FstatSource.hpp"
#include "depotsync/Pipeline.hpp"
#include "depotsync/ReconciliationController.hpp"
#include "depotsync/ServiceClient.hpp"
#include "depotsync/StateStore.hpp"
#include "depotsync/WorkspaceScanner.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace depotsync;

namespace {

const char kUsage[] =
    "Usage:\n"
    "  depotsync sync <dir>[@<changelist>] [-f]\n"
    "  depotsync clean <dir>[@<changelist>] [--discard]\n"
    "  depotsync fstat <changelist> [--changed <from>]\n"
    "  depotsync head\n"
    "  depotsync drop|keep|keep-any [-C <dir>] --<predicate>...\n"
    "  depotsync progress [<label>]\n"
    "  depotsync fail\n"
    "  depotsync manifold [-m <bytes>]\n"
    "  depotsync gatling [-C <dir>] [-n <workers>] [-m <bytes>] [-f]\n"
    "\n"
    "Predicates: checksum existence deletes havelist case (--not-<name> "
    "inverts)\n";

class UsageError : public Error {
public:
  using Error::Error;
};

struct Target {
  std::string dir;
  std::optional<int64_t> changelist;
};

int64_t parseNumber(const std::string &text, const char *what) {
  auto value = FstatCodec::parseNumber(text);
  if (!value)
    throw UsageError(std::string("Invalid ") + what + ": " + text);
  return *value;
}

// "<dir>@<cl>" or "<dir>"
Target parseTarget(const std::string &arg) {
  Target target{arg, std::nullopt};
  auto at = arg.rfind('@');
  if (at != std::string::npos && at + 1 < arg.size() &&
      arg.find_first_not_of("0123456789", at + 1) == std::string::npos) {
    target.dir = arg.substr(0, at);
    target.changelist = parseNumber(arg.substr(at + 1), "changelist");
  }
  if (target.dir.empty())
    target.dir = ".";
  target.dir = fs::absolute(target.dir).lexically_normal().string();
  return target;
}

std::unique_ptr<ServiceClient> makeServiceClient(const Config &config) {
  if (config.serviceUrl.empty())
    return nullptr;
  return std::make_unique<ServiceClient>(
      config.serviceUrl, config.username, config.password, config.proxyUrl,
      config.serviceTimeoutSeconds);
}

void printReport(const SyncReport &report) {
  std::cerr << "[Main] " << toString(report.state) << ": " << report.previous
            << " -> " << report.target << ", " << report.requested
            << " requested, " << report.firstTransfer << " transferred, "
            << report.secondTransfer << " retried";
  if (report.cleaned)
    std::cerr << ", " << report.cleaned << " cleaned";
  std::cerr << std::endl;
}

int runSync(const Config &config, const std::vector<std::string> &args,
            bool cleaning) {
  std::optional<Target> target;
  bool force = false, discard = false;
  for (const auto &arg : args) {
    if (!cleaning && arg == "-f")
      force = true;
    else if (cleaning && arg == "--discard")
      discard = true;
    else if (!target && !arg.empty() && arg[0] != '-')
      target = parseTarget(arg);
    else
      throw UsageError("Unexpected argument: " + arg);
  }
  if (!target)
    throw UsageError("Missing directory");

  CommandFstatSource source(config.fstatCommand, config.headCommand,
                            target->dir);
  auto service = makeServiceClient(config);
  std::unique_ptr<FstatCache> localCache;
  if (config.localCacheEntries > 0) {
    localCache =
        std::make_unique<FstatCache>(FstatCache::localPath(target->dir));
    localCache->open();
  }
  FstatQuery query(source, service.get(), localCache.get(),
                   config.localCacheEntries);
  CommandTransferExecutor executor(config.transferCommand,
                                   config.forceArguments, config.depotPrefix,
                                   target->dir);
  ReconciliationController controller(config, target->dir, query, executor);

  SyncReport report = cleaning ? controller.clean(target->changelist, discard)
                               : controller.sync(target->changelist, force);
  printReport(report);
  if (report.state != SyncState::Done) {
    std::cerr << "[Main] Error: " << report.failedPaths.size()
              << " file(s) did not verify:" << std::endl;
    for (const auto &path : report.failedPaths)
      std::cerr << "  " << path << std::endl;
    return 1;
  }
  return 0;
}

int runFstat(const Config &config, const std::vector<std::string> &args) {
  std::optional<int64_t> to;
  int64_t from = 0;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--changed" && i + 1 < args.size())
      from = parseNumber(args[++i], "changelist");
    else if (!to)
      to = parseNumber(args[i], "changelist");
    else
      throw UsageError("Unexpected argument: " + args[i]);
  }
  if (config.depotPrefix.empty())
    throw ConfigError("depot_prefix is not configured");

  CommandFstatSource source(config.fstatCommand, config.headCommand);
  auto service = makeServiceClient(config);
  FstatQuery query(source, service.get());
  int64_t upper = to ? *to : query.head(config.depotPrefix);
  for (const auto &record : query.changes(config.depotPrefix, from, upper))
    FstatCodec::write(std::cout, record);
  std::cout.flush();
  return 0;
}

int runHead(const Config &config) {
  if (config.depotPrefix.empty())
    throw ConfigError("depot_prefix is not configured");
  CommandFstatSource source(config.fstatCommand, config.headCommand);
  std::cout << source.head(config.depotPrefix) << std::endl;
  return 0;
}

int runFilter(const Config &config, FilterStage::Mode mode,
              const std::vector<std::string> &args) {
  std::string dir = ".";
  std::vector<PredicateSpec> predicates;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "-C" && i + 1 < args.size())
      dir = args[++i];
    else
      predicates.push_back(parsePredicate(args[i]));
  }
  dir = fs::absolute(dir).lexically_normal().string();

  WorkspaceScanner scanner(dir);
  std::optional<LocalState> state;
  for (const auto &p : predicates) {
    if (p.kind == Predicate::HaveList && !state) {
      StateStore store(dir);
      store.open();
      state = store.load();
    }
  }

  FilterContext context;
  context.scanner = &scanner;
  context.state = state ? &*state : nullptr;
  context.caseInsensitive = config.caseInsensitive;

  Pipeline pipeline(config.channelCapacity);
  pipeline.emplace<FilterStage>(mode, predicates, context);
  pipeline.run(std::cin, std::cout);
  return 0;
}

int runManifold(const Config &config, const std::vector<std::string> &args) {
  std::size_t cap = config.batchBytes;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "-m" && i + 1 < args.size())
      cap = static_cast<std::size_t>(parseNumber(args[++i], "byte count"));
    else
      throw UsageError("Unexpected argument: " + args[i]);
  }

  Batcher batcher(cap);
  std::size_t number = 0;
  auto emit = [&number](const Batch &batch) {
    std::cout << Batcher::kSeparator << " " << ++number
              << " records=" << batch.records.size()
              << " bytes=" << batch.bytes << "\n";
    for (const auto &record : batch.records)
      FstatCodec::write(std::cout, record);
  };
  while (auto record = FstatCodec::read(std::cin)) {
    if (auto batch = batcher.add(std::move(*record)))
      emit(*batch);
  }
  if (auto batch = batcher.flush())
    emit(*batch);
  std::cout.flush();
  return 0;
}

int runGatling(const Config &config, const std::vector<std::string> &args) {
  std::string dir = ".";
  std::size_t workers = config.workers;
  std::size_t cap = config.batchBytes;
  TransferMode mode = TransferMode::Normal;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "-C" && i + 1 < args.size())
      dir = args[++i];
    else if (args[i] == "-n" && i + 1 < args.size())
      workers = static_cast<std::size_t>(parseNumber(args[++i], "workers"));
    else if (args[i] == "-m" && i + 1 < args.size())
      cap = static_cast<std::size_t>(parseNumber(args[++i], "byte count"));
    else if (args[i] == "-f")
      mode = TransferMode::Force;
    else
      throw UsageError("Unexpected argument: " + args[i]);
  }
  dir = fs::absolute(dir).lexically_normal().string();

  CommandTransferExecutor executor(config.transferCommand,
                                   config.forceArguments, config.depotPrefix,
                                   dir);
  TransferStage stage(executor, mode, workers, cap);
  stage.run(std::cin, std::cout);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios::sync_with_stdio(false);

  if (argc < 2) {
    std::cerr << kUsage;
    return 2;
  }
  const std::string command = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  try {
    const Config config = Config::load();

    if (command == "sync")
      return runSync(config, args, false);
    if (command == "clean")
      return runSync(config, args, true);
    if (command == "fstat")
      return runFstat(config, args);
    if (command == "head")
      return runHead(config);
    if (command == "drop")
      return runFilter(config, FilterStage::Mode::Drop, args);
    if (command == "keep")
      return runFilter(config, FilterStage::Mode::Keep, args);
    if (command == "keep-any")
      return runFilter(config, FilterStage::Mode::KeepAny, args);
    if (command == "manifold")
      return runManifold(config, args);
    if (command == "gatling")
      return runGatling(config, args);

    Pipeline pipeline(config.channelCapacity);
    if (command == "progress") {
      pipeline.emplace<ProgressStage>(args.empty() ? "records" : args.front(),
                                      config.progressInterval);
    } else if (command == "fail") {
      pipeline.emplace<FailStage>();
    } else {
      std::cerr << "[Main] Unknown command: " << command << "\n" << kUsage;
      return 2;
    }
    pipeline.run(std::cin, std::cout);
    return 0;
  } catch (const UsageError &e) {
    std::cerr << "[Main] " << e.what() << "\n" << kUsage;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
}
