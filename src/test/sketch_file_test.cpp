#define BOOST_TEST_MODULE SketchFileTests
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

#include <dirent.h>

#include "errors.hpp"
#include "files.hpp"
#include "sketch/sketch_file.hpp"
#include "test/fake_mash.hpp"

namespace {

// Scratch output directory, a fake mash and a logger that goes nowhere
struct SketchFixture {
  SketchFixture()
      : work("sketch_test_"), logger(log_out), mash(runner, logger, "mash") {
    runner.on("sketch", fake_sketch);
    runner.on("info", fake_info);
    genomes["g1"] = "/data/genomes/g1.fna";
    genomes["g2"] = "/data/genomes/g2.fna.gz";
  }

  std::string out(const std::string &name) const {
    return join_path(work.path(), name);
  }

  TempDir work;
  std::ostringstream log_out;
  Logger logger;
  FakeRunner runner;
  MashTool mash;
  GenomeMap genomes;
};

size_t n_entries(const std::string &dir) {
  size_t n = 0;
  DIR *listing = opendir(dir.c_str());
  BOOST_REQUIRE(listing != nullptr);
  struct dirent *entry;
  while ((entry = readdir(listing)) != nullptr) {
    const std::string name(entry->d_name);
    if (name != "." && name != "..") {
      ++n;
    }
  }
  closedir(listing);
  return n;
}

} // namespace

BOOST_AUTO_TEST_SUITE(consistency)

BOOST_AUTO_TEST_CASE(file_names_compared_not_directories) {
  SketchInfo sketch;
  sketch["/old/location/g1.fna"] = SketchEntry{5000, 100};
  sketch["/old/location/g2.fna"] = SketchEntry{5000, 100};
  GenomeMap genomes;
  genomes["a"] = "/new/place/g1.fna";
  genomes["b"] = "g2.fna";
  BOOST_CHECK(sketch_consistent(sketch, genomes));
}

BOOST_AUTO_TEST_CASE(missing_or_extra_genomes) {
  SketchInfo sketch;
  sketch["/x/g1.fna"] = SketchEntry{5000, 100};
  sketch["/x/g2.fna"] = SketchEntry{5000, 100};

  GenomeMap fewer;
  fewer["a"] = "/x/g1.fna";
  BOOST_CHECK(!sketch_consistent(sketch, fewer));

  GenomeMap more = fewer;
  more["b"] = "/x/g2.fna";
  more["c"] = "/x/g3.fna";
  BOOST_CHECK(!sketch_consistent(sketch, more));

  GenomeMap different;
  different["a"] = "/x/g1.fna";
  different["b"] = "/x/g4.fna";
  BOOST_CHECK(!sketch_consistent(sketch, different));
}

BOOST_AUTO_TEST_CASE(parse_info_table) {
  const std::string info_out =
      "#Hashes\tLength\tID\tComment\n"
      "5000\t2837461\t/data/g1.fna\t[12 seqs] NZ_AAA01000001.1 [...]\n"
      "4999\t1200\t/data/g2.fna\t\n"
      "not\ta\tgenome\tline\n"
      "\n";
  SketchInfo info = parse_sketch_info(info_out);
  BOOST_REQUIRE_EQUAL(info.size(), 2u);
  BOOST_CHECK_EQUAL(info["/data/g1.fna"].hashes, 5000u);
  BOOST_CHECK_EQUAL(info["/data/g1.fna"].length, 2837461u);
  BOOST_CHECK_EQUAL(info["/data/g2.fna"].hashes, 4999u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(sketch_file, SketchFixture)

BOOST_AUTO_TEST_CASE(generates_when_absent) {
  const std::string path = out("nested/sketch.msh");
  SketchFile sketch(genomes, path, mash, 4, 21, 1000);

  BOOST_CHECK(sketch.origin() == SketchOrigin::Generated);
  BOOST_CHECK(file_exists(path));
  BOOST_REQUIRE_EQUAL(runner.count("sketch"), 1u);
  BOOST_CHECK_EQUAL(runner.count("info"), 0u);

  const std::vector<std::string> &args = runner.calls[0].args;
  BOOST_CHECK_EQUAL(args[0], "mash");
  BOOST_CHECK_EQUAL(args[2], "-l");
  BOOST_CHECK_EQUAL(option_value(args, "-p"), "4");
  BOOST_CHECK_EQUAL(option_value(args, "-k"), "21");
  BOOST_CHECK_EQUAL(option_value(args, "-s"), "1000");
  BOOST_CHECK_EQUAL(option_value(args, "-o"), path);

  // Scratch list of genomes is gone
  BOOST_CHECK(!file_exists(args[5]));
  BOOST_CHECK(!file_exists(dir_name(args[5])));

  // One tick per genome
  BOOST_CHECK(log_out.str().find("Progress: 2/2 genome(s) 100.0%") !=
              std::string::npos);
  BOOST_CHECK(log_out.str().find("Creating Mash sketch file") !=
              std::string::npos);
}

BOOST_AUTO_TEST_CASE(reloads_existing) {
  const std::string path = out("sketch.msh");
  { SketchFile first(genomes, path, mash, 1, 16, 5000); }
  SketchFile second(genomes, path, mash, 1, 16, 5000);

  BOOST_CHECK(second.origin() == SketchOrigin::Cached);
  BOOST_CHECK_EQUAL(runner.count("sketch"), 1u);
  BOOST_CHECK_EQUAL(runner.count("info"), 1u);
  BOOST_CHECK(sketch_consistent(second.data(), genomes));
  BOOST_CHECK_EQUAL(second.data().size(), genomes.size());
}

BOOST_AUTO_TEST_CASE(moved_genomes_still_consistent) {
  const std::string path = out("sketch.msh");
  { SketchFile first(genomes, path, mash, 1, 16, 5000); }

  GenomeMap moved;
  moved["g1"] = "/mnt/other/g1.fna";
  moved["g2"] = "/mnt/other/g2.fna.gz";
  SketchFile second(moved, path, mash, 1, 16, 5000);
  BOOST_CHECK(second.origin() == SketchOrigin::Cached);
}

BOOST_AUTO_TEST_CASE(mismatch_is_config_error) {
  const std::string path = out("sketch.msh");
  write_file(path, "/data/genomes/other.fna\n");

  BOOST_CHECK_THROW(SketchFile(genomes, path, mash, 1, 16, 5000), ConfigError);
  BOOST_CHECK_EQUAL(runner.count("sketch"), 0u);
  BOOST_CHECK_EQUAL(read_file(path), "/data/genomes/other.fna\n");
}

BOOST_AUTO_TEST_CASE(sketch_failure_is_tool_error) {
  FakeRunner failing;
  failing.on("sketch", [](const std::vector<std::string> &args,
                          const LineCallback &) {
    write_file(option_value(args, "-o"), "partial");
    return ProcessResult{1, "", "ERROR: could not open genome file"};
  });
  MashTool failing_mash(failing, logger, "mash");
  const std::string path = out("sketch.msh");

  try {
    SketchFile sketch(genomes, path, failing_mash, 1, 16, 5000);
    BOOST_FAIL("expected ToolError");
  } catch (const ToolError &e) {
    BOOST_CHECK(std::string(e.what()).find("could not open genome file") !=
                std::string::npos);
  }
  BOOST_CHECK(!file_exists(path));
  BOOST_CHECK(!file_exists(dir_name(failing.calls[0].args[5])));
}

BOOST_AUTO_TEST_CASE(missing_output_is_tool_error) {
  FakeRunner silent;
  silent.on("sketch", [](const std::vector<std::string> &,
                         const LineCallback &) {
    return ProcessResult{0, "", "nothing written"};
  });
  MashTool silent_mash(silent, logger, "mash");
  BOOST_CHECK_THROW(
      SketchFile(genomes, out("sketch.msh"), silent_mash, 1, 16, 5000),
      ToolError);
}

BOOST_AUTO_TEST_CASE(info_failure_is_tool_error) {
  const std::string path = out("sketch.msh");
  write_file(path, "not a sketch");
  FakeRunner broken;
  broken.on("info", [](const std::vector<std::string> &,
                       const LineCallback &) {
    return ProcessResult{1, "", "terminate called: bad capnp"};
  });
  MashTool broken_mash(broken, logger, "mash");

  try {
    SketchFile sketch(genomes, path, broken_mash, 1, 16, 5000);
    BOOST_FAIL("expected ToolError");
  } catch (const ToolError &e) {
    BOOST_CHECK(std::string(e.what()).find("bad capnp") != std::string::npos);
  }
  BOOST_CHECK_EQUAL(read_file(path), "not a sketch");
}

BOOST_AUTO_TEST_CASE(query_sketch_path) {
  QrySketchFile sketch(genomes, work.path(), "run1", mash, 1, 16, 5000);
  BOOST_CHECK_EQUAL(sketch.path(),
                    join_path(work.path(), "run1.user_query_sketch.msh"));
  BOOST_CHECK(file_exists(sketch.path()));
}

BOOST_AUTO_TEST_CASE(reference_default_path) {
  RefSketchFile sketch(genomes, work.path(), "run1", mash, 1, 16, 5000);
  BOOST_CHECK_EQUAL(sketch.path(),
                    join_path(work.path(), "run1.ref_sketch.msh"));
}

BOOST_AUTO_TEST_CASE(reference_database_path) {
  const std::string db = out("nested/db");
  RefSketchFile sketch(genomes, work.path(), "run1", mash, 1, 16, 5000, db);
  BOOST_CHECK_EQUAL(sketch.path(), db + ".msh");
  BOOST_CHECK(file_exists(db + ".msh"));

  // Reused by a later run, trailing separator and all
  RefSketchFile reused(genomes, work.path(), "run2", mash, 1, 16, 5000,
                       db + ".msh/");
  BOOST_CHECK(reused.origin() == SketchOrigin::Cached);
  BOOST_CHECK_EQUAL(runner.count("sketch"), 1u);
}

BOOST_AUTO_TEST_CASE(reference_database_is_directory) {
  make_path(out("db.msh"));
  const size_t before = n_entries(work.path());

  BOOST_CHECK_THROW(RefSketchFile(genomes, work.path(), "run1", mash, 1, 16,
                                  5000, out("db")),
                    ConfigError);
  BOOST_CHECK_EQUAL(runner.calls.size(), 0u);
  BOOST_CHECK_EQUAL(n_entries(work.path()), before);
  BOOST_CHECK(!file_exists(join_path(work.path(), "run1.ref_sketch.msh")));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(db_path)

BOOST_AUTO_TEST_CASE(suffix_added_once) {
  BOOST_CHECK_EQUAL(normalise_db_path("/nonexistent/ref"),
                    "/nonexistent/ref.msh");
  BOOST_CHECK_EQUAL(normalise_db_path("/nonexistent/ref.msh"),
                    "/nonexistent/ref.msh");
  BOOST_CHECK_EQUAL(normalise_db_path("/nonexistent/ref.msh/"),
                    "/nonexistent/ref.msh");
  BOOST_CHECK_EQUAL(normalise_db_path("/nonexistent/ref\\\\"),
                    "/nonexistent/ref.msh");
}

BOOST_AUTO_TEST_SUITE_END()
