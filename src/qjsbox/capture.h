#ifndef QJSBOX_CAPTURE_H_
#define QJSBOX_CAPTURE_H_

#include <string>
#include <vector>
#include <filesystem>

// Per-run box holding two capture files that stand in for the jailed program's stdout and stderr.
// The box is a fresh mkdtemp directory, so concurrent channels never share files.
// Everything the channel created is removed by Release(), which the destructor calls.
class CaptureChannel {
  std::filesystem::path box_;
  int stdout_fd_, stderr_fd_;
  // in creation order; removed in reverse
  std::vector<std::filesystem::path> created_;
  bool released_;

  bool MakeDir_(const std::filesystem::path&, std::filesystem::perms);
 public:
  struct Output {
    std::string stdout_text, stderr_text;
  };

  // throws CaptureSetupError; nothing is left behind on failure
  CaptureChannel();
  CaptureChannel(const CaptureChannel&) = delete;
  CaptureChannel& operator=(const CaptureChannel&) = delete;
  ~CaptureChannel() { Release(); }

  const std::filesystem::path& BoxDir() const { return box_; }
  // write ends to be wired as the program's output; close-on-exec
  int StdoutFd() const { return stdout_fd_; }
  int StderrFd() const { return stderr_fd_; }

  // create a directory (and missing parents) below the box; removed on release
  bool AddDir(const std::filesystem::path& path, std::filesystem::perms perms);
  // close the write ends and read back both files;
  //   call only after the program has stopped writing
  Output Finalize();
  // idempotent
  void Release();
};

#endif  // QJSBOX_CAPTURE_H_
