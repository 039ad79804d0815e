#ifndef QJSBOX_SANDBOX_EXEC_H_
#define QJSBOX_SANDBOX_EXEC_H_

#include "sandbox.h"

// We separate this from sandbox.h because the helper executable links only sandbox.cpp and cjail,
//   while this function needs the logging and path settings of the server.

// Run the options through the sandbox-exec helper and block until the jailed program exits.
// cjail is not known to be thread-safe, so every call forks and execs a fresh helper;
//   this makes concurrent calls from different threads independent of each other.
// Descriptors in fd_input/fd_output/fd_error may be close-on-exec; they are passed to the helper
//   under the same numbers. All other descriptors of this process stay out of the helper.
// On failure, timekill is set to -1 and oomkill holds the errno.
struct cjail_result SandboxExec(const SandboxOptions&);

#endif  // QJSBOX_SANDBOX_EXEC_H_
