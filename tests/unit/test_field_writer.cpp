#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "solvload/io/VectorFiles.hpp"
#include "solvload/output/FieldWriter.hpp"
#include "test_util.hpp"

using solvload::FieldArray;

TEST(FieldWriterTest, OneLinePerFrameWithTrailingSpace) {
  FieldArray f(2, 3);
  f(0, 2) = 10.0;
  f(1, 0) = 7.0;
  std::ostringstream oss;
  solvload::output::write_field(oss, f);
  EXPECT_EQ(oss.str(), "0 0 10 \n7 0 0 \n");
}

TEST(FieldWriterTest, ValuesRoundTrip) {
  FieldArray f(1, 4);
  f(0, 0) = 0.1;
  f(0, 1) = -1.0 / 3.0;
  f(0, 2) = 6.02214076e23;
  f(0, 3) = 1e-300;
  std::ostringstream oss;
  solvload::output::write_field(oss, f);
  const auto back = solvload::parse_real_list(oss.str(), "field");
  ASSERT_EQ(back.size(), 4u);
  for (std::size_t i = 0; i < 4; ++i) EXPECT_EQ(back[i], f(0, i));
}

TEST(FieldWriterTest, WritesFileAtomically) {
  solvload::test::TempDir dir;
  FieldArray f(3, 1, 2.5);
  solvload::output::write_field_text(dir / "trj.dat", f);
  EXPECT_EQ(solvload::test::read_file(dir / "trj.dat"), "2.5 \n2.5 \n2.5 \n");
  EXPECT_FALSE(std::filesystem::exists(dir / "trj.dat.tmp"));
}

TEST(FieldWriterTest, TemplateSubstitutesOnlyKnownNames) {
  const std::string out = solvload::output::render_template("a {x} {y} {{x}} {x", {{"x", "1"}});
  EXPECT_EQ(out, "a 1 {y} {1} {x");
}

TEST(FieldWriterTest, VmdScriptHasInputsAndRepresentations) {
  solvload::output::VmdScriptParams p;
  p.traj_fn = "traj.dcd";
  p.top_fn = "top.pdb";
  p.step = 4;
  p.dat_fn = "trj.dat";
  const std::string s = solvload::output::render_vmd_script(p);

  EXPECT_NE(s.find("set mol [mol new traj.dcd step 4 waitfor all]"), std::string::npos);
  EXPECT_NE(s.find("mol addfile top.pdb waitfor all"), std::string::npos);
  EXPECT_NE(s.find("set fp [open trj.dat r]"), std::string::npos);
  EXPECT_NE(s.find("for {set i 0} {$i < $nf} {incr i} {"), std::string::npos);
  EXPECT_NE(s.find("$sel set user $line"), std::string::npos);
  EXPECT_NE(s.find("mol representation NewCartoon 0.3 10.0 4.1 0"), std::string::npos);
  EXPECT_NE(s.find("mol selection {protein}"), std::string::npos);
  EXPECT_NE(s.find("mol selection {user > 1}"), std::string::npos);
  EXPECT_NE(s.find("mol selupdate 1 top 1"), std::string::npos);
  EXPECT_NE(s.find("mol colupdate 1 top 1"), std::string::npos);
  EXPECT_EQ(s.find("{traj_fn}"), std::string::npos);
  EXPECT_EQ(s.find("{dat_fn}"), std::string::npos);
}

TEST(FieldWriterTest, VmdScriptThreshold) {
  solvload::output::VmdScriptParams p;
  p.traj_fn = "t";
  p.top_fn = "p";
  p.dat_fn = "d";
  p.user_threshold = "0.25";
  EXPECT_NE(solvload::output::render_vmd_script(p).find("mol selection {user > 0.25}"), std::string::npos);
}
