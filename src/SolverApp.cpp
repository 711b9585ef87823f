#include "SolverApp.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "../lib/Logger.h"
#include "../lib/MatrixIO.h"
#include "../lib/SolverFactory.h"

using namespace spcode;

namespace {

std::string format_usage() {
    return
        "Usage:\n"
        "  spcode_infer --conf config.json [--dictionary D.csv] [--data X.csv]\n"
        "               [--init A0.csv] [--out A.csv]\n"
        "  spcode_infer config.json\n";
}

}  // namespace

int SolverApp::run(int argc, char** argv) const {
    auto opts = parse_arguments(argc, argv);
    Config cfg = load_config(opts);

    Logger::init(cfg.logging.file, parseLogLevel(cfg.logging.level));

    const Eigen::MatrixXd dictionary = MatrixIO::load_csv(cfg.io.dictionary);
    const Eigen::MatrixXd data = MatrixIO::load_csv(cfg.io.data);

    std::unique_ptr<InferenceMethod> method = SolverFactory::create(cfg);

    InferOptions options;
    options.checkNan = cfg.inference.check_nan;

    const auto t0 = std::chrono::steady_clock::now();
    InferenceResult result;
    if (!cfg.io.warm_start.empty()) {
        const Eigen::MatrixXd coeff0 = MatrixIO::load_csv(cfg.io.warm_start);
        result = method->inferWarmStart(dictionary, data, coeff0, options);
    } else {
        result = method->infer(dictionary, data, options);
    }
    const double seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - t0).count();

    MatrixIO::save_csv(cfg.io.output, result.coefficients);
    write_trajectory(cfg, result);
    write_summary(cfg, dictionary, data, result, seconds);

    std::cout << "Coefficients written to " << cfg.io.output << std::endl;
    return 0;
}

SolverApp::CliOptions SolverApp::parse_arguments(int argc, char** argv) const {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](int& idx) -> const char* {
            if (idx + 1 < argc) return argv[++idx];
            throw std::runtime_error("Missing value for argument: " + arg);
        };

        if (arg == "--conf" || arg == "-c") {
            opts.configPath = next(i);
        } else if (arg == "--dictionary" || arg == "-d") {
            opts.overrideDictionary = next(i);
        } else if (arg == "--data" || arg == "-x") {
            opts.overrideData = next(i);
        } else if (arg == "--init") {
            opts.overrideWarmStart = next(i);
        } else if (arg == "--out" || arg == "-o") {
            opts.overrideOut = next(i);
        } else if (arg.size() > 5 && arg.substr(arg.size() - 5) == ".json" && i == 1) {
            opts.configPath = arg;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << format_usage();
            std::exit(0);
        } else {
            throw std::runtime_error("Unknown argument: " + arg + "\n" + format_usage());
        }
    }
    return opts;
}

Config SolverApp::load_config(const CliOptions& opts) const {
    Config cfg = ConfigLoader::from_file(opts.configPath);
    if (!opts.overrideDictionary.empty()) cfg.io.dictionary = opts.overrideDictionary;
    if (!opts.overrideData.empty()) cfg.io.data = opts.overrideData;
    if (!opts.overrideWarmStart.empty()) cfg.io.warm_start = opts.overrideWarmStart;
    if (!opts.overrideOut.empty()) cfg.io.output = opts.overrideOut;
    return cfg;
}

void SolverApp::write_trajectory(const Config& cfg, const InferenceResult& result) const {
    if (cfg.io.trajectory_dir.empty() || result.trajectory.empty()) return;

    std::filesystem::create_directories(cfg.io.trajectory_dir);
    for (size_t t = 0; t < result.trajectory.size(); ++t) {
        std::ostringstream name;
        name << cfg.io.trajectory_dir << "/step_" << std::setw(5) << std::setfill('0') << t << ".csv";
        MatrixIO::save_csv(name.str(), result.trajectory[t]);
    }
    Logger::info("Wrote {} trajectory snapshots to {}", result.trajectory.size(), cfg.io.trajectory_dir);
}

void SolverApp::write_summary(
    const Config& cfg,
    const Eigen::MatrixXd& dictionary,
    const Eigen::MatrixXd& data,
    const InferenceResult& result,
    double seconds) const {
    const Eigen::MatrixXd residual = data - result.coefficients * dictionary.transpose();
    const double nnz = static_cast<double>((result.coefficients.array() != 0.0).count());
    const double density = result.coefficients.size() > 0
        ? nnz / static_cast<double>(result.coefficients.size()) : 0.0;

    Logger::info("method={} iterations={} stopped_early={} time={:.3f}s",
        to_string(cfg.method), result.iterations, result.stoppedEarly, seconds);
    Logger::info("reconstruction error (Frobenius)={:.6g} relative={:.6g} density={:.4f}",
        residual.norm(),
        data.norm() > 0.0 ? residual.norm() / data.norm() : 0.0,
        density);
}
