#include "solver/LiveSolverBridge.h"
#include "Errors.h"

#include <iostream>
#include <optional>
#include <utility> // For std::move

namespace gto_broker {
namespace solver {

namespace {

std::shared_ptr<ProcessRunner> DefaultRunner(const config::SolverConfig& config) {
    PosixProcessRunner::Options options;
    options.work_root = config.work_root;
    options.transient_exit_codes = config.transient_exit_codes;
    options.retry_on_timeout = config.retry_on_timeout;
    options.retry_backoff = config.retry_backoff;
    return std::make_shared<PosixProcessRunner>(std::move(options));
}

std::shared_ptr<cache::SolutionCache> DefaultCache(const config::SolverConfig& config) {
    std::shared_ptr<cache::SolutionStore> store;
    if (!config.cache_dir.empty()) {
        store = std::make_shared<cache::FileSolutionStore>(config.cache_dir);
    }
    return std::make_shared<cache::SolutionCache>(std::move(store));
}

} // namespace

LiveSolverBridge::Pipeline::Pipeline(config::SolverConfig config, std::shared_ptr<ProcessRunner> runner)
    : builder(config),
      parser(config.output_schema),
      runner(runner ? std::move(runner) : DefaultRunner(config)),
      pool(config.worker_pool_size) {}

strategy::SolutionPtr LiveSolverBridge::Pipeline::Compute(const canonical::CanonicalSituation& situation,
                                                          const std::string& key) {
    ProcessInvocation invocation = builder.Build(situation);
    RawOutput raw;
    {
        WorkerSlotPool::Slot slot = pool.Acquire();
        std::cout << "[INFO] Solving " << key << std::endl;
        raw = runner->Run(invocation, builder.GetConfig().timeout);
    }
    const config::OutputSchema& schema = builder.GetConfig().output_schema;
    int acting_player = situation.position_label == "IP" ? schema.ip_player : schema.oop_player;
    auto solution = std::make_shared<const strategy::Solution>(
        parser.Parse(raw, canonical::SuitMapping::Identity(), situation.street_line, acting_player));
    std::cout << "[INFO] Solved " << key << ": " << solution->Size() << " hands, "
              << solution->GetIterations() << " iterations, exploitability "
              << solution->GetExploitability() << ", " << raw.elapsed.count() << " ms" << std::endl;
    return solution;
}

LiveSolverBridge::LiveSolverBridge(config::SolverConfig config,
                                   std::shared_ptr<cache::SolutionCache> cache,
                                   std::shared_ptr<ProcessRunner> runner)
    : Solver(config.bucketing) {
    config.Validate();
    PosixProcessRunner::CheckExecutable(config.binary_path);
    cache_ = cache ? std::move(cache) : DefaultCache(config);
    pipeline_ = std::make_shared<Pipeline>(std::move(config), std::move(runner));
}

strategy::SolutionPtr LiveSolverBridge::LookupCanonical(const canonical::CanonicalForm& form) {
    const std::string& key = form.key.SituationPart();
    std::shared_ptr<Pipeline> pipeline = pipeline_;
    canonical::CanonicalSituation situation = form.situation;

    std::optional<std::chrono::milliseconds> wait_timeout;
    if (pipeline->builder.GetConfig().wait_timeout.count() > 0) {
        wait_timeout = pipeline->builder.GetConfig().wait_timeout;
    }
    try {
        return cache_->GetOrCompute(
            key,
            [pipeline, situation, key]() { return pipeline->Compute(situation, key); },
            wait_timeout);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Solve failed for " << key << ": " << e.what() << std::endl;
        throw;
    }
}

} // namespace solver
} // namespace gto_broker
