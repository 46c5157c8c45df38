#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "cli/cli.hpp"
#include "crypto/hasher.hpp"
#include "storage/local_store.hpp"
#include "test_utils.hpp"

using namespace farmtrace;

class CLITest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
    test_dir = test::make_temp_dir("cli_test_");
    store = std::make_unique<storage::LocalStore>((test_dir / "store").string());
    pipeline = std::make_unique<pipeline::StagePipeline>(*store);
  }

  void TearDown() override {
    pipeline.reset();
    store.reset();
    std::filesystem::remove_all(test_dir);
  }

  // Runs the shell over the given script and returns everything it printed
  std::string run_script(const std::string& script) {
    std::istringstream in(script);
    std::ostringstream out;
    cli::CLI shell(*pipeline, in, out);
    shell.run();
    return out.str();
  }

  std::string write_file(const std::string& name, const std::string& contents) {
    auto path = test_dir / name;
    std::ofstream(path) << contents;
    return path.string();
  }

  std::filesystem::path test_dir;
  std::unique_ptr<storage::LocalStore> store;
  std::unique_ptr<pipeline::StagePipeline> pipeline;
};

TEST_F(CLITest, HelpListsCommands) {
  std::string output = run_script("help\nquit\n");
  EXPECT_NE(output.find("upload <file>"), std::string::npos);
  EXPECT_NE(output.find("farmtrace> "), std::string::npos);
}

TEST_F(CLITest, UploadPinsDocument) {
  std::string path = write_file("doc.json", R"({"batch":"B1"})");
  std::string output = run_script("upload " + path + "\nquit\n");

  std::string cid = crypto::general_hash(R"({"batch":"B1"})").text.substr(2);
  EXPECT_NE(output.find(cid), std::string::npos);
  EXPECT_TRUE(store->is_pinned(cid));
}

TEST_F(CLITest, GetPrintsContent) {
  std::string cid = store->upload("stored text").cid;
  std::string output = run_script("get " + cid + "\n");
  EXPECT_NE(output.find("stored text"), std::string::npos);
}

TEST_F(CLITest, PinUnpinStatus) {
  std::string cid = store->upload("x").cid;
  std::string output = run_script("pin " + cid + "\nstatus " + cid + "\nunpin " + cid + "\nstatus " + cid + "\n");
  EXPECT_NE(output.find(cid + " is pinned"), std::string::npos);
  EXPECT_NE(output.find(cid + " is not pinned"), std::string::npos);
  EXPECT_FALSE(store->is_pinned(cid));
}

TEST_F(CLITest, ErrorsAreReportedNotThrown) {
  std::string output = run_script("get nothex\nupload /no/such/file.json\nfrobnicate x\nget\n");
  EXPECT_NE(output.find("Error fetching content"), std::string::npos);
  EXPECT_NE(output.find("Error opening file"), std::string::npos);
  EXPECT_NE(output.find("Unknown command"), std::string::npos);
  EXPECT_NE(output.find("Invalid input"), std::string::npos);
}

TEST_F(CLITest, RejectsNonJsonUpload) {
  std::string path = write_file("bad.json", "not json");
  std::string output = run_script("upload " + path + "\n");
  EXPECT_NE(output.find("File is not valid JSON"), std::string::npos);
}
