#pragma once

#include <string>
#include <Eigen/Dense>

namespace spcode {

    /// Dense matrix CSV loading and saving
    class MatrixIO {
    public:
        /**
         * Load a dense matrix, one row per line.
         * Separators: comma, semicolon, tab or spaces. Blank lines and a UTF-8 BOM are
         * skipped; a first line that does not parse as numbers is taken as a header.
         * @throws std::runtime_error if the file cannot be opened, a row is malformed,
         *         rows have different lengths or nothing was loaded
         */
        static Eigen::MatrixXd load_csv(const std::string& path);

        /// Writes with 12 significant digits; creates parent directories.
        static void save_csv(const std::string& path, const Eigen::MatrixXd& m);
    };

} // namespace spcode
