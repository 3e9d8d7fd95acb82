/**
 * @file resume.cpp
 * @brief Resume reconciliation implementation
 */

#include "net_stage/resume.hpp"

namespace net_stage {

namespace {

ResumeDecision keep(FileState state) {
  return {state, RequeueTarget::None, false, false, false};
}

ResumeDecision to_download() {
  return {FileState::Pending, RequeueTarget::Download, true, true, true};
}

ResumeDecision to_encode() {
  return {FileState::Local, RequeueTarget::Encode, false, true, true};
}

} // anonymous namespace

ResumeDecision reconcile(FileState loaded, const ArtifactPresence &artifacts) {
  switch (loaded) {
  case FileState::Complete:
  case FileState::Failed:
    return keep(loaded);

  case FileState::Pending:
  case FileState::Downloading:
    return to_download();

  case FileState::Local:
  case FileState::Encoding:
    /// A half-written encode is discarded; the local copy is re-encoded
    return artifacts.local_exists ? to_encode() : to_download();

  case FileState::Uploading:
    if (artifacts.output_exists)
      return {FileState::Uploading, RequeueTarget::Upload, false, false,
              false};
    return artifacts.local_exists ? to_encode() : to_download();
  }
  return to_download();
}

} // namespace net_stage
