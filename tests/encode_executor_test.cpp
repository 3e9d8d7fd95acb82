#include "net_stage/encode_executor.hpp"

#include <gtest/gtest.h>

#include "test_util.hpp"

namespace net_stage {
namespace {

namespace fs = std::filesystem;
using test::read_file;
using test::write_file;

TEST(ShellQuoteTest, WrapsInSingleQuotes) {
  EXPECT_EQ(shell_quote("/nas/my movie.mkv"), "'/nas/my movie.mkv'");
}

TEST(ShellQuoteTest, EscapesEmbeddedQuotes) {
  EXPECT_EQ(shell_quote("it's.mkv"), "'it'\\''s.mkv'");
}

class EncodeExecutorTest : public test::ScratchDirTest {};

TEST_F(EncodeExecutorTest, RunsTemplateWithQuotedPaths) {
  fs::path in = root_ / "in put.mkv";
  fs::path out = root_ / "out put.mp4";
  write_file(in, 100, 'i');

  /// Not a media file, so the probe rejects it after the command succeeds
  EXPECT_FALSE(execute_encode(in.string(), out.string(), "cp {input} {output}"));
  EXPECT_EQ(read_file(out), read_file(in));
}

TEST_F(EncodeExecutorTest, NonZeroExitIsFailure) {
  EncodeProgress progress;
  progress.fraction.store(0.5);
  EXPECT_FALSE(execute_encode((root_ / "a.mkv").string(),
                              (root_ / "b.mp4").string(), "exit 3",
                              &progress));
  EXPECT_DOUBLE_EQ(progress.fraction.load(), 0.0);
}

TEST_F(EncodeExecutorTest, InvalidTemplateIsFailure) {
  EXPECT_FALSE(execute_encode("a", "b", "ffmpeg -i {input} {outptu"));
  EXPECT_FALSE(execute_encode("a", "b", "ffmpeg -i {input} {unknown}"));
}

TEST_F(EncodeExecutorTest, ProbeRejectsNonMedia) {
  fs::path junk = root_ / "junk.mp4";
  write_file(junk, 2048, 'z');
  MediaInfo info;
  EXPECT_FALSE(probe_media_output(junk.string(), info));
  EXPECT_FALSE(probe_media_output((root_ / "missing.mp4").string(), info));
}

} // namespace
} // namespace net_stage
