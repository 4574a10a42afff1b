#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>
#include "cli/cli.hpp"
#include "store/memory_backend.hpp"
#include "test_utils.hpp"

using namespace stash;
namespace fs = std::filesystem;

class CLITest : public ::testing::Test {
protected:
  fs::path test_dir_;
  std::unique_ptr<crypto::KeyManager> keys_;
  store::MemoryBackend backend_;
  std::unique_ptr<Stash> stash_;
  std::ostringstream out_;
  std::unique_ptr<cli::CLI> cli_;

  void SetUp() override {
    init_logging();
    test_dir_ = make_test_dir("stash_cli_test");
    keys_ = std::make_unique<crypto::KeyManager>("cli test", "", test_kdf());
    StashConfig config;
    config.workers = 2;
    stash_ = std::make_unique<Stash>(backend_, *keys_, config);
    stash_->load();
    cli_ = std::make_unique<cli::CLI>(*stash_, out_);
  }

  void TearDown() override {
    fs::remove_all(test_dir_);
  }

  int run(const std::string& command, const std::vector<std::string>& args = {}) {
    out_.str("");
    return cli_->process_command(command, args);
  }
};

TEST_F(CLITest, HelpListsCommands) {
  EXPECT_EQ(run("help"), cli::EXIT_OK);
  EXPECT_NE(out_.str().find("commit"), std::string::npos);
  EXPECT_NE(out_.str().find("checkout"), std::string::npos);
  EXPECT_NE(out_.str().find("ls"), std::string::npos);
}

TEST_F(CLITest, UnknownCommandFails) {
  EXPECT_EQ(run("frobnicate"), cli::EXIT_FAILURE_STATUS);
  EXPECT_NE(out_.str().find("Unknown command: frobnicate"), std::string::npos);
}

TEST_F(CLITest, MissingArgumentsPrintUsage) {
  EXPECT_EQ(run("commit"), cli::EXIT_FAILURE_STATUS);
  EXPECT_NE(out_.str().find("Usage: commit"), std::string::npos);
  EXPECT_EQ(run("checkout"), cli::EXIT_FAILURE_STATUS);
  EXPECT_NE(out_.str().find("Usage: checkout"), std::string::npos);
}

TEST_F(CLITest, CommitListCheckout) {
  fs::path source = test_dir_ / "source";
  write_file(source / "notes.txt", std::vector<uint8_t>{'n', 'o', 't', 'e', 's'});
  write_file(source / "data" / "blob.bin", random_data(100 * 1024, 1));

  EXPECT_EQ(run("commit", {source.string()}), cli::EXIT_OK);
  EXPECT_NE(out_.str().find("Committed 2 files"), std::string::npos);

  EXPECT_EQ(run("ls"), cli::EXIT_OK);
  EXPECT_NE(out_.str().find(normalize_path(source / "notes.txt")), std::string::npos);
  EXPECT_NE(out_.str().find(normalize_path(source / "data" / "blob.bin")), std::string::npos);
  // The committed directory itself sorts first
  EXPECT_EQ(out_.str().front(), 'd');

  EXPECT_EQ(run("ls", {"*.txt"}), cli::EXIT_OK);
  EXPECT_NE(out_.str().find("notes.txt"), std::string::npos);
  EXPECT_EQ(out_.str().find("blob.bin"), std::string::npos);

  fs::path target = test_dir_ / "restore";
  EXPECT_EQ(run("checkout", {target.string(), "*/data/*"}), cli::EXIT_OK);
  EXPECT_NE(out_.str().find("Restored 1 files"), std::string::npos);
  fs::path restored = target / normalize_path(source);
  EXPECT_EQ(read_file(restored / "data" / "blob.bin"), read_file(source / "data" / "blob.bin"));
  EXPECT_FALSE(fs::exists(restored / "notes.txt"));
}

TEST_F(CLITest, FailedCommitReportsError) {
  EXPECT_EQ(run("commit", {(test_dir_ / "missing").string()}), cli::EXIT_FAILURE_STATUS);
  EXPECT_NE(out_.str().find("Commit failed"), std::string::npos);
}

TEST_F(CLITest, PartialCheckoutReturnsPartialStatus) {
  fs::path source = test_dir_ / "source";
  write_file(source / "bad.bin", random_data(50 * 1024, 2));
  write_file(source / "good.bin", random_data(50 * 1024, 3));
  ASSERT_EQ(run("commit", {source.string()}), cli::EXIT_OK);

  auto entry = stash_->file_index().find(normalize_path(source / "bad.bin"));
  ASSERT_TRUE(entry.has_value());
  auto location = stash_->chunk_index().find(entry->chunks[0].hash);
  ASSERT_TRUE(location.has_value());
  auto region = backend_.get(location->object);
  std::vector<uint8_t> bytes(region->data(), region->data() + region->size());
  bytes[location->offset] ^= 0xff;
  backend_.put(location->object, bytes);

  EXPECT_EQ(run("checkout", {(test_dir_ / "restore").string()}), cli::EXIT_PARTIAL);
  EXPECT_NE(out_.str().find("FAILED " + normalize_path(source / "bad.bin")), std::string::npos);
}

TEST_F(CLITest, ListMarksSymlinks) {
  fs::path source = test_dir_ / "source";
  write_file(source / "real.txt", std::vector<uint8_t>{'r'});
  fs::create_symlink("real.txt", source / "alias");
  ASSERT_EQ(run("commit", {source.string()}), cli::EXIT_OK);
  EXPECT_NE(out_.str().find("1 symlinks"), std::string::npos);

  EXPECT_EQ(run("ls", {"*/alias"}), cli::EXIT_OK);
  EXPECT_EQ(out_.str().front(), 'l');
  EXPECT_NE(out_.str().find("alias -> real.txt"), std::string::npos);
}

TEST(PassphraseTest, ReadsOneLineWithoutNewline) {
  std::istringstream in("correct horse\nsecond line\n");
  std::ostringstream prompt;
  EXPECT_EQ(cli::read_passphrase(in, prompt, -1), "correct horse");
  EXPECT_EQ(prompt.str(), "Passphrase: ");
}

TEST(PassphraseTest, EmptyInputGivesEmptyPassphrase) {
  std::istringstream in("");
  std::ostringstream prompt;
  EXPECT_EQ(cli::read_passphrase(in, prompt, -1), "");
}
