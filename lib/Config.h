#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "GenericOptimizerSolver.h"
#include "IHT.h"
#include "ISTA.h"
#include "LCA.h"
#include "LSM.h"
#include "MP.h"
#include "Optimizer.h"
#include "Vanilla.h"

namespace spcode {

    /// Which solver the front end builds
    enum class Method {
        LCA,
        Vanilla,
        ISTA,
        LSM,
        Optimizer,
        IHT,
        MP,
        OMP
    };

    /// "lca" | "vanilla" | "ista" | "lsm" | "optimizer" | "iht" | "mp" | "omp"
    /// @throws InvalidConfigurationError for unknown names
    Method parseMethod(const std::string& s);
    std::string to_string(Method m);

    enum class OptimizerKind { SGD, Adam };

    /// Optimizer-driven solver settings (loss is ReconstructionL1Loss)
    struct OptimizerSolverConfig {
        int    n_iter = 100;
        double sparsity_penalty = 0.0;
        OptimizerKind kind = OptimizerKind::Adam;
        double lr = 1e-3;
        double momentum = 0.0;      ///< SGD only
        TrajectoryMode trajectory = TrajectoryMode::None;
    };

    struct InferenceSettings {
        bool check_nan = false;
    };

    /// Input / output files of the command line front end
    struct IOConfig {
        std::string dictionary = "dictionary.csv";
        std::string data = "data.csv";
        std::string warm_start;         ///< empty = solver default
        std::string output = "results/coefficients.csv";
        std::string trajectory_dir;     ///< empty = trajectory not written
    };

    struct LoggingConfig {
        std::string file;               ///< empty = stdout
        std::string level = "INFO";
    };

    /// Complete configuration
    struct Config {
        Method method = Method::ISTA;

        LCAConfig lca;
        VanillaConfig vanilla;
        ISTAConfig ista;
        LSMConfig lsm;
        OptimizerSolverConfig optimizer;
        IHTConfig iht;
        PursuitConfig mp;
        PursuitConfig omp;

        InferenceSettings inference;
        IOConfig io;
        LoggingConfig logging;
    };

    class ConfigLoader {
    public:
        /**
         * Load a Config from a JSON file. Missing keys keep their defaults.
         * @throws std::runtime_error if the file cannot be opened or parsed
         * @throws InvalidConfigurationError for bad enumerations (method, trajectory)
         */
        static Config from_file(const std::string& path);

        static Config from_json(const nlohmann::json& j);
    };

} // namespace spcode
