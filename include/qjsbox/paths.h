#ifndef INCLUDE_QJSBOX_PATHS_H_
#define INCLUDE_QJSBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// Create kBoxRoot if needed. False unless it is a real directory owned by
//   the current user and not writable by group or others.
bool PrepareBoxRoot();

// sandbox binary used when none is configured
fs::path DefaultModulePath();
// helper executable that runs cjail_exec on behalf of the server
fs::path SandboxExecPath();

#endif  // INCLUDE_QJSBOX_PATHS_H_
