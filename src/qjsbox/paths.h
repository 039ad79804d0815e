#ifndef QJSBOX_PATHS_H_
#define QJSBOX_PATHS_H_

#include <qjsbox/paths.h>

// parents of the per-process staging directories and the per-run boxes
fs::path ModuleRoot();
fs::path RunRoot();

// box layout; the box itself is the chroot of the jailed program
extern const char kWorkdirRelative[];
fs::path Workdir(const fs::path& box, bool inside_box = false);
// not reachable by the sandbox uid; holds the capture files
fs::path CaptureDir(const fs::path& box);
fs::path CaptureStdout(const fs::path& box);
fs::path CaptureStderr(const fs::path& box);
// mount point of a host directory inside the box
fs::path MountPoint(const fs::path& box, const fs::path& host_dir);

#endif  // QJSBOX_PATHS_H_
