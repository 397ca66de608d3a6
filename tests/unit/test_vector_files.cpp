#include <gtest/gtest.h>

#include <vector>

#include "solvload/io/AssignmentFile.hpp"
#include "solvload/io/VectorFiles.hpp"
#include "test_util.hpp"

TEST(VectorFilesTest, ParsesIndicesWithComments) {
  const auto v = solvload::parse_index_list("# solvent atoms\n3 4\n  5\t6 # tail\n", "test");
  EXPECT_EQ(v, (std::vector<std::int64_t>{3, 4, 5, 6}));
  EXPECT_TRUE(solvload::parse_index_list("", "test").empty());
  EXPECT_TRUE(solvload::parse_index_list("# nothing pruned\n", "test").empty());
}

TEST(VectorFilesTest, RejectsBadIndices) {
  EXPECT_THROW(solvload::parse_index_list("1 2 x", "test"), std::runtime_error);
  EXPECT_THROW(solvload::parse_index_list("1 -2", "test"), std::runtime_error);
  EXPECT_THROW(solvload::parse_index_list("1.5", "test"), std::runtime_error);
}

TEST(VectorFilesTest, ParsesReals) {
  const auto v = solvload::parse_real_list("1.0 -2.5e-3\n+4 0\n", "test");
  ASSERT_EQ(v.size(), 4u);
  EXPECT_DOUBLE_EQ(v[0], 1.0);
  EXPECT_DOUBLE_EQ(v[1], -2.5e-3);
  EXPECT_DOUBLE_EQ(v[2], 4.0);
  EXPECT_DOUBLE_EQ(v[3], 0.0);
}

TEST(VectorFilesTest, RejectsNonFiniteLoadings) {
  EXPECT_THROW(solvload::parse_real_list("1.0 nan", "test"), std::runtime_error);
  EXPECT_THROW(solvload::parse_real_list("inf", "test"), std::runtime_error);
  EXPECT_THROW(solvload::parse_real_list("1.0abc", "test"), std::runtime_error);
}

TEST(VectorFilesTest, ReadsFiles) {
  solvload::test::TempDir dir;
  solvload::test::write_file(dir / "idx.dat", "10\n11\n12\n");
  solvload::test::write_file(dir / "load.dat", "0.5 0.25\n");
  EXPECT_EQ(solvload::read_index_file(dir / "idx.dat"), (std::vector<std::int64_t>{10, 11, 12}));
  EXPECT_EQ(solvload::read_real_file(dir / "load.dat"), (std::vector<double>{0.5, 0.25}));
  EXPECT_THROW(solvload::read_real_file(dir / "missing.dat"), std::runtime_error);
}

TEST(VectorFilesTest, PacksTextAssignments) {
  solvload::test::TempDir dir;
  solvload::test::write_file(dir / "assn.txt",
                             "# frame solvent solute shell\n"
                             "0 0 0 0\n"
                             "\n"
                             "0 1 2 3\n"
                             "5 4 3 2\n");
  EXPECT_EQ(solvload::pack_assignment_text(dir / "assn.txt", dir / "assn.assn"), 3u);

  solvload::AssignmentFileReader r(dir / "assn.assn");
  std::vector<solvload::AssignmentRow> rows;
  r.read(0, r.row_count(), rows);
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[1], (solvload::AssignmentRow{0, 1, 2, 3}));
  EXPECT_EQ(rows[2], (solvload::AssignmentRow{5, 4, 3, 2}));
}

TEST(VectorFilesTest, PackRejectsMalformedLines) {
  solvload::test::TempDir dir;
  solvload::test::write_file(dir / "three.txt", "0 0 0\n");
  EXPECT_THROW(solvload::pack_assignment_text(dir / "three.txt", dir / "o.assn"), std::runtime_error);
  solvload::test::write_file(dir / "five.txt", "0 0 0 0 0\n");
  EXPECT_THROW(solvload::pack_assignment_text(dir / "five.txt", dir / "o.assn"), std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(dir / "o.assn"));
}
