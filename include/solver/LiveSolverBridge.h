#ifndef GTO_BROKER_SOLVER_LIVE_SOLVER_BRIDGE_H_
#define GTO_BROKER_SOLVER_LIVE_SOLVER_BRIDGE_H_

#include "cache/SolutionCache.h"
#include "solver/CommandBuilder.h"
#include "solver/OutputParser.h"
#include "solver/ProcessRunner.h"
#include "solver/Solver.h"
#include "solver/WorkerSlotPool.h"
#include "tools/SolverConfig.h"

#include <memory>

namespace gto_broker {
namespace solver {

// Solver backed by the external binary: cache lookup first, otherwise one
// coalesced run per canonical situation, bounded by the worker pool.
class LiveSolverBridge : public Solver {
 public:
  // Args:
  //   config: Solver configuration; validated here.
  //   cache: Shared cache. Null means a cache over config.cache_dir, or a
  //          memory-only one when cache_dir is empty.
  //   runner: Process runner. Null means a PosixProcessRunner set up from
  //           the config.
  // Throws:
  //   ConfigurationError for an invalid config.
  //   SpawnError if the configured binary is missing or not executable.
  explicit LiveSolverBridge(config::SolverConfig config,
                            std::shared_ptr<cache::SolutionCache> cache = nullptr,
                            std::shared_ptr<ProcessRunner> runner = nullptr);

  const std::shared_ptr<cache::SolutionCache>& GetCache() const { return cache_; }
  const config::SolverConfig& GetConfig() const { return pipeline_->builder.GetConfig(); }

 protected:
  strategy::SolutionPtr LookupCanonical(const canonical::CanonicalForm& form) override;

 private:
  // Shared with in-flight computations, which may outlive the bridge.
  struct Pipeline {
    Pipeline(config::SolverConfig config, std::shared_ptr<ProcessRunner> runner);

    strategy::SolutionPtr Compute(const canonical::CanonicalSituation& situation,
                                  const std::string& key);

    CommandBuilder builder;
    OutputParser parser;
    std::shared_ptr<ProcessRunner> runner;
    WorkerSlotPool pool;
  };

  std::shared_ptr<Pipeline> pipeline_;
  std::shared_ptr<cache::SolutionCache> cache_;
};

} // namespace solver
} // namespace gto_broker

#endif // GTO_BROKER_SOLVER_LIVE_SOLVER_BRIDGE_H_
