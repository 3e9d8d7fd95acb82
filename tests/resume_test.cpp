#include "net_stage/resume.hpp"

#include <gtest/gtest.h>

#include "net_stage/file_record.hpp"

namespace net_stage {
namespace {

ArtifactPresence artifacts(bool local, bool output) {
  ArtifactPresence a;
  a.local_exists = local;
  a.output_exists = output;
  return a;
}

void expect_download(const ResumeDecision &d) {
  EXPECT_EQ(d.state, FileState::Pending);
  EXPECT_EQ(d.target, RequeueTarget::Download);
  EXPECT_TRUE(d.clear_local);
  EXPECT_TRUE(d.clear_output);
  EXPECT_TRUE(d.clear_final);
}

void expect_encode(const ResumeDecision &d) {
  EXPECT_EQ(d.state, FileState::Local);
  EXPECT_EQ(d.target, RequeueTarget::Encode);
  EXPECT_FALSE(d.clear_local);
  EXPECT_TRUE(d.clear_output);
  EXPECT_TRUE(d.clear_final);
}

TEST(ReconcileTest, TerminalStatesAreKeptAndNotQueued) {
  for (FileState state : {FileState::Complete, FileState::Failed}) {
    for (bool local : {false, true}) {
      for (bool output : {false, true}) {
        ResumeDecision d = reconcile(state, artifacts(local, output));
        EXPECT_EQ(d.state, state);
        EXPECT_EQ(d.target, RequeueTarget::None);
        EXPECT_FALSE(d.clear_local || d.clear_output || d.clear_final);
      }
    }
  }
}

TEST(ReconcileTest, PendingGoesToDownload) {
  expect_download(reconcile(FileState::Pending, artifacts(false, false)));
}

TEST(ReconcileTest, DownloadingRestartsTheCopy) {
  /// A local file from an interrupted copy is never trusted
  expect_download(reconcile(FileState::Downloading, artifacts(true, false)));
  expect_download(reconcile(FileState::Downloading, artifacts(false, false)));
}

TEST(ReconcileTest, LocalWithFileGoesToEncode) {
  expect_encode(reconcile(FileState::Local, artifacts(true, false)));
}

TEST(ReconcileTest, LocalWithoutFileGoesToDownload) {
  expect_download(reconcile(FileState::Local, artifacts(false, false)));
}

TEST(ReconcileTest, EncodingWithFileIsReEncoded) {
  expect_encode(reconcile(FileState::Encoding, artifacts(true, false)));
  expect_encode(reconcile(FileState::Encoding, artifacts(true, true)));
}

TEST(ReconcileTest, EncodingWithoutFileGoesToDownload) {
  expect_download(reconcile(FileState::Encoding, artifacts(false, false)));
}

TEST(ReconcileTest, UploadingWithOutputIsRequeuedAsIs) {
  ResumeDecision d = reconcile(FileState::Uploading, artifacts(false, true));
  EXPECT_EQ(d.state, FileState::Uploading);
  EXPECT_EQ(d.target, RequeueTarget::Upload);
  EXPECT_FALSE(d.clear_local || d.clear_output || d.clear_final);
}

TEST(ReconcileTest, UploadingWithOnlyLocalIsReEncoded) {
  expect_encode(reconcile(FileState::Uploading, artifacts(true, false)));
}

TEST(ReconcileTest, UploadingWithNothingGoesToDownload) {
  expect_download(reconcile(FileState::Uploading, artifacts(false, false)));
}

TEST(ReconcileTest, RewindTargetsAreNeverTransitional) {
  for (FileState state :
       {FileState::Pending, FileState::Downloading, FileState::Local,
        FileState::Encoding, FileState::Uploading}) {
    for (bool local : {false, true}) {
      for (bool output : {false, true}) {
        ResumeDecision d = reconcile(state, artifacts(local, output));
        EXPECT_NE(d.state, FileState::Downloading);
        EXPECT_NE(d.state, FileState::Encoding);
        EXPECT_NE(d.target, RequeueTarget::None) << to_string(state);
      }
    }
  }
}

} // namespace
} // namespace net_stage
