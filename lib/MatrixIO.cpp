#include "MatrixIO.h"
#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace spcode {

    Eigen::MatrixXd MatrixIO::load_csv(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw std::runtime_error("Cannot open matrix file: " + path);
        }

        std::vector<std::vector<double>> rows;
        std::string line;
        size_t lineNo = 0;
        while (std::getline(ifs, line)) {
            ++lineNo;

            // strip BOM
            if (lineNo == 1 && line.size() >= 3 &&
                (unsigned char)line[0] == 0xEF &&
                (unsigned char)line[1] == 0xBB &&
                (unsigned char)line[2] == 0xBF) {
                line.erase(0, 3);
            }

            auto notspace = [](unsigned char ch) { return !std::isspace(ch); };
            line.erase(line.begin(), std::find_if(line.begin(), line.end(), notspace));
            line.erase(std::find_if(line.rbegin(), line.rend(), notspace).base(), line.end());
            if (line.empty() || line[0] == '#') continue;

            for (char& ch : line) {
                if (ch == ',' || ch == ';' || ch == '\t') ch = ' ';
            }

            std::istringstream iss(line);
            std::vector<double> row;
            double v;
            while (iss >> v) row.push_back(v);
            if (!iss.eof()) {
                if (rows.empty() && row.empty()) continue;     // header
                throw std::runtime_error("Parse error in " + path + " at line " + std::to_string(lineNo));
            }
            if (!rows.empty() && row.size() != rows.front().size()) {
                throw std::runtime_error("Line " + std::to_string(lineNo) + " of " + path + " has " +
                    std::to_string(row.size()) + " values, expected " + std::to_string(rows.front().size()));
            }
            rows.push_back(std::move(row));
        }
        if (rows.empty()) {
            throw std::runtime_error("No data loaded from " + path);
        }

        Eigen::MatrixXd m(static_cast<Eigen::Index>(rows.size()),
            static_cast<Eigen::Index>(rows.front().size()));
        for (size_t i = 0; i < rows.size(); ++i)
            for (size_t j = 0; j < rows[i].size(); ++j)
                m(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];

        Logger::info("Loaded {}x{} matrix from {}", m.rows(), m.cols(), path);
        return m;
    }

    void MatrixIO::save_csv(const std::string& path, const Eigen::MatrixXd& m) {
        const std::filesystem::path p(path);
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            throw std::runtime_error("Cannot write matrix file: " + path);
        }
        ofs << std::setprecision(12);
        for (Eigen::Index i = 0; i < m.rows(); ++i) {
            for (Eigen::Index j = 0; j < m.cols(); ++j) {
                if (j) ofs << ',';
                ofs << m(i, j);
            }
            ofs << '\n';
        }
        if (!ofs) {
            throw std::runtime_error("Failed writing matrix file: " + path);
        }
    }

} // namespace spcode
