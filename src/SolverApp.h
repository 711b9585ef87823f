#pragma once

#include <string>

#include <Eigen/Dense>

#include "../lib/Config.h"
#include "../lib/InferenceMethod.h"

class SolverApp {
public:
    int run(int argc, char** argv) const;

private:
    struct CliOptions {
        std::string configPath = "config.json";
        std::string overrideDictionary;
        std::string overrideData;
        std::string overrideWarmStart;
        std::string overrideOut;
    };

    CliOptions parse_arguments(int argc, char** argv) const;
    spcode::Config load_config(const CliOptions& opts) const;

    void write_trajectory(
        const spcode::Config& cfg,
        const spcode::InferenceResult& result) const;

    void write_summary(
        const spcode::Config& cfg,
        const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const spcode::InferenceResult& result,
        double seconds) const;
};
