#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "MatrixIO.h"

using namespace spcode;

namespace {

    class MatrixIOTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = std::filesystem::temp_directory_path() / "spcode_matrix_io";
            std::filesystem::remove_all(dir_);
            std::filesystem::create_directories(dir_);
        }
        void TearDown() override {
            std::filesystem::remove_all(dir_);
        }

        std::string write(const std::string& name, const std::string& content) const {
            const auto path = dir_ / name;
            std::ofstream ofs(path);
            ofs << content;
            return path.string();
        }

        std::filesystem::path dir_;
    };

}

TEST_F(MatrixIOTest, SaveThenLoad) {
    Eigen::MatrixXd m(2, 3);
    m << 1.0, -2.5, 3.125,
         0.0, 1e-7, 42.0;
    const std::string path = (dir_ / "nested" / "m.csv").string();
    MatrixIO::save_csv(path, m);

    const Eigen::MatrixXd back = MatrixIO::load_csv(path);
    EXPECT_TRUE(back.isApprox(m, 1e-12));
}

TEST_F(MatrixIOTest, AcceptsHeaderCommentsAndSeparators) {
    const std::string path = write("mixed.csv",
        "\xEF\xBB\xBF" "a;b;c\n"
        "# comment\n"
        "1;2;3\n"
        "\n"
        "4\t5\t6\n"
        "7 8 9\n");
    const Eigen::MatrixXd m = MatrixIO::load_csv(path);
    ASSERT_EQ(m.rows(), 3);
    ASSERT_EQ(m.cols(), 3);
    EXPECT_DOUBLE_EQ(m(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(m(1, 1), 5.0);
    EXPECT_DOUBLE_EQ(m(2, 2), 9.0);
}

TEST_F(MatrixIOTest, RejectsMalformedFiles) {
    EXPECT_THROW(MatrixIO::load_csv(write("ragged.csv", "1,2,3\n4,5\n")), std::runtime_error);
    EXPECT_THROW(MatrixIO::load_csv(write("junk.csv", "1,2\n3,x\n")), std::runtime_error);
    EXPECT_THROW(MatrixIO::load_csv(write("empty.csv", "# nothing\n")), std::runtime_error);
    EXPECT_THROW(MatrixIO::load_csv((dir_ / "missing.csv").string()), std::runtime_error);
}

TEST_F(MatrixIOTest, NonAsciiHeaderIsSkipped) {
    // UTF-8 header whose first and last bytes are outside ASCII
    const std::string path = write("utf8.csv",
        "\xC3\x84nderung;Ma\xC3\x9F\n"
        "1;2\n"
        "3;4\n");
    const Eigen::MatrixXd m = MatrixIO::load_csv(path);
    ASSERT_EQ(m.rows(), 2);
    ASSERT_EQ(m.cols(), 2);
    EXPECT_DOUBLE_EQ(m(1, 0), 3.0);
}
