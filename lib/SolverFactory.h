#pragma once

#include <memory>
#include "Config.h"
#include "InferenceMethod.h"

namespace spcode {

    class SolverFactory {
    public:
        /// Build the solver selected by cfg.method from its section of the config.
        /// @throws InvalidConfigurationError when the section is invalid
        static std::unique_ptr<InferenceMethod> create(const Config& cfg);

        static std::shared_ptr<const GradientOptimizer> makeOptimizer(const OptimizerSolverConfig& cfg);
    };

} // namespace spcode
