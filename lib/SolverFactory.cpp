#include "SolverFactory.h"
#include "Logger.h"
#include "OMP.h"

namespace spcode {

    std::shared_ptr<const GradientOptimizer> SolverFactory::makeOptimizer(const OptimizerSolverConfig& cfg) {
        switch (cfg.kind) {
        case OptimizerKind::SGD: {
            SGDConfig sc;
            sc.lr = cfg.lr;
            sc.momentum = cfg.momentum;
            return std::make_shared<SGD>(sc);
        }
        case OptimizerKind::Adam: {
            AdamConfig ac;
            ac.lr = cfg.lr;
            return std::make_shared<Adam>(ac);
        }
        }
        throw InvalidConfigurationError("unknown optimizer kind");
    }

    std::unique_ptr<InferenceMethod> SolverFactory::create(const Config& cfg) {
        Logger::info("Creating inference method '{}'", to_string(cfg.method));
        switch (cfg.method) {
        case Method::LCA:     return std::make_unique<LCA>(cfg.lca);
        case Method::Vanilla: return std::make_unique<Vanilla>(cfg.vanilla);
        case Method::ISTA:    return std::make_unique<ISTA>(cfg.ista);
        case Method::LSM:     return std::make_unique<LSM>(cfg.lsm);
        case Method::Optimizer: {
            GenericOptimizerConfig gc;
            gc.n_iter = cfg.optimizer.n_iter;
            gc.trajectory = cfg.optimizer.trajectory;
            return std::make_unique<GenericOptimizerSolver>(
                std::make_shared<ReconstructionL1Loss>(cfg.optimizer.sparsity_penalty),
                makeOptimizer(cfg.optimizer), gc);
        }
        case Method::IHT:     return std::make_unique<IHT>(cfg.iht);
        case Method::MP:      return std::make_unique<MP>(cfg.mp);
        case Method::OMP:     return std::make_unique<OMP>(cfg.omp);
        }
        throw InvalidConfigurationError("unknown inference method");
    }

} // namespace spcode
