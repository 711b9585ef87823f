#include "Config.h"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace spcode {

    Method parseMethod(const std::string& s) {
        if (s == "lca") return Method::LCA;
        if (s == "vanilla") return Method::Vanilla;
        if (s == "ista") return Method::ISTA;
        if (s == "lsm") return Method::LSM;
        if (s == "optimizer") return Method::Optimizer;
        if (s == "iht") return Method::IHT;
        if (s == "mp") return Method::MP;
        if (s == "omp") return Method::OMP;
        throw InvalidConfigurationError("Unknown inference method: " + s);
    }

    std::string to_string(Method m) {
        switch (m) {
        case Method::LCA:       return "lca";
        case Method::Vanilla:   return "vanilla";
        case Method::ISTA:      return "ista";
        case Method::LSM:       return "lsm";
        case Method::Optimizer: return "optimizer";
        case Method::IHT:       return "iht";
        case Method::MP:        return "mp";
        case Method::OMP:       return "omp";
        }
        return "unknown";
    }

    static OptimizerKind parseOptimizerKind(const std::string& s) {
        if (s == "sgd") return OptimizerKind::SGD;
        if (s == "adam") return OptimizerKind::Adam;
        throw InvalidConfigurationError("Unknown optimizer: " + s + " (expected 'sgd' or 'adam')");
    }

    static TrajectoryMode trajectoryOf(const json& j, TrajectoryMode fallback) {
        if (!j.contains("trajectory")) return fallback;
        const auto& jt = j["trajectory"];
        // plain booleans are accepted for the solvers that only record or not
        if (jt.is_boolean())
            return jt.get<bool>() ? TrajectoryMode::PostNonlinearity : TrajectoryMode::None;
        return parseTrajectoryMode(jt.get<std::string>());
    }

    void from_json(const json& j, LCAConfig& c) {
        c.n_iter = j.value("n_iter", c.n_iter);
        c.coeff_lr = j.value("coeff_lr", c.coeff_lr);
        c.threshold = j.value("threshold", c.threshold);
        c.stop_early = j.value("stop_early", c.stop_early);
        c.epsilon = j.value("epsilon", c.epsilon);
        c.trajectory = trajectoryOf(j, c.trajectory);
    }

    void from_json(const json& j, VanillaConfig& c) {
        c.n_iter = j.value("n_iter", c.n_iter);
        c.coeff_lr = j.value("coeff_lr", c.coeff_lr);
        c.sparsity_penalty = j.value("sparsity_penalty", c.sparsity_penalty);
        c.stop_early = j.value("stop_early", c.stop_early);
        c.epsilon = j.value("epsilon", c.epsilon);
        c.seed = j.value("seed", c.seed);
        c.trajectory = trajectoryOf(j, c.trajectory);
    }

    void from_json(const json& j, ISTAConfig& c) {
        c.n_iter = j.value("n_iter", c.n_iter);
        c.sparsity_penalty = j.value("sparsity_penalty", c.sparsity_penalty);
        c.stop_early = j.value("stop_early", c.stop_early);
        c.epsilon = j.value("epsilon", c.epsilon);
        c.trajectory = trajectoryOf(j, c.trajectory);
    }

    void from_json(const json& j, LSMConfig& c) {
        c.n_iter = j.value("n_iter", c.n_iter);
        c.n_iter_lsm = j.value("n_iter_lsm", c.n_iter_lsm);
        c.beta = j.value("beta", c.beta);
        c.alpha = j.value("alpha", c.alpha);
        c.sigma = j.value("sigma", c.sigma);
        c.sparse_threshold = j.value("sparse_threshold", c.sparse_threshold);
        c.lr = j.value("lr", c.lr);
        c.trajectory = trajectoryOf(j, c.trajectory);
    }

    void from_json(const json& j, OptimizerSolverConfig& c) {
        c.n_iter = j.value("n_iter", c.n_iter);
        c.sparsity_penalty = j.value("sparsity_penalty", c.sparsity_penalty);
        if (j.contains("optimizer")) c.kind = parseOptimizerKind(j["optimizer"].get<std::string>());
        c.lr = j.value("lr", c.lr);
        c.momentum = j.value("momentum", c.momentum);
        c.trajectory = trajectoryOf(j, c.trajectory);
    }

    void from_json(const json& j, IHTConfig& c) {
        c.sparsity = j.value("sparsity", c.sparsity);
        c.n_iter = j.value("n_iter", c.n_iter);
        c.trajectory = trajectoryOf(j, c.trajectory);
    }

    void from_json(const json& j, PursuitConfig& c) {
        c.sparsity = j.value("sparsity", c.sparsity);
        c.trajectory = trajectoryOf(j, c.trajectory);
    }

    Config ConfigLoader::from_json(const json& j) {
        Config cfg; // defaults live in the structs

        if (j.contains("method")) cfg.method = parseMethod(j["method"].get<std::string>());

        if (j.contains("lca"))       j.at("lca").get_to(cfg.lca);
        if (j.contains("vanilla"))   j.at("vanilla").get_to(cfg.vanilla);
        if (j.contains("ista"))      j.at("ista").get_to(cfg.ista);
        if (j.contains("lsm"))       j.at("lsm").get_to(cfg.lsm);
        if (j.contains("optimizer")) j.at("optimizer").get_to(cfg.optimizer);
        if (j.contains("iht"))       j.at("iht").get_to(cfg.iht);
        if (j.contains("mp"))        j.at("mp").get_to(cfg.mp);
        if (j.contains("omp"))       j.at("omp").get_to(cfg.omp);

        // inference section
        if (j.contains("inference")) {
            auto& ji = j["inference"];
            if (ji.contains("check_nan")) cfg.inference.check_nan = ji["check_nan"].get<bool>();
        }

        // io section
        if (j.contains("io")) {
            auto& jio = j["io"];
            if (jio.contains("dictionary"))     cfg.io.dictionary = jio["dictionary"].get<std::string>();
            if (jio.contains("data"))           cfg.io.data = jio["data"].get<std::string>();
            if (jio.contains("warm_start"))     cfg.io.warm_start = jio["warm_start"].get<std::string>();
            if (jio.contains("output"))         cfg.io.output = jio["output"].get<std::string>();
            if (jio.contains("trajectory_dir")) cfg.io.trajectory_dir = jio["trajectory_dir"].get<std::string>();
        }

        // logging section
        if (j.contains("logging")) {
            auto& jl = j["logging"];
            if (jl.contains("file"))  cfg.logging.file = jl["file"].get<std::string>();
            if (jl.contains("level")) cfg.logging.level = jl["level"].get<std::string>();
        }
        return cfg;
    }

    Config ConfigLoader::from_file(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw std::runtime_error("Cannot open config file: " + path);
        }
        json j;
        try {
            ifs >> j;
        }
        catch (const json::parse_error& e) {
            throw std::runtime_error(std::string("JSON parse error: ") + e.what());
        }
        try {
            return from_json(j);
        }
        catch (const json::type_error& e) {
            throw std::runtime_error(std::string("JSON type error in " + path + ": ") + e.what());
        }
    }

} // namespace spcode
