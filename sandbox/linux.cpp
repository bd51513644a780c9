#include "sandbox/linux.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sched.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {
const constexpr int kNamespaceFlags = CLONE_NEWUSER | CLONE_NEWNS;

// Makes every mount of the namespace private and read-only.
bool MakeFilesystemReadOnly() {
  struct mount_attr attr = {};
  attr.attr_set = MOUNT_ATTR_RDONLY;
  attr.propagation = MS_PRIVATE;
  return mount_setattr(AT_FDCWD, "/", AT_RECURSIVE, &attr, sizeof(attr)) == 0;
}

// Forks a short-lived child that tries to create the namespaces and to make
// the filesystem read-only.
bool CanCreateNamespaces() {
  pid_t pid = fork();
  if (pid == -1) return false;
  if (pid == 0) {
    if (unshare(kNamespaceFlags | CLONE_NEWNET) != 0) _Exit(1);
    _Exit(MakeFilesystemReadOnly() ? 0 : 2);
  }
  int status = 0;
  int ret = 0;
  do {
    ret = waitpid(pid, &status, 0);
  } while (ret == -1 && errno == EINTR);
  return ret == pid && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}
}  // namespace

namespace sandbox {

int Linux::Score() {
  if (!CanCreateNamespaces()) {
    LOG(WARNING) << "User and mount namespaces are not available, the "
                    "network and the filesystem cannot be isolated";
    return -1;
  }
  return 3;
}

bool Linux::OnChild(char* error_msg, size_t buflen) {
  auto fail = [error_msg, buflen](const char* prefix) {
    strncpy(error_msg, prefix, buflen - 1);
    strncat(error_msg, ": ", buflen - strlen(error_msg) - 1);
    strncat(error_msg, strerror(errno), buflen - strlen(error_msg) - 1);
    return false;
  };
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) return fail("prctl");
  int flags = kNamespaceFlags;
  if (options_->deny_network) flags |= CLONE_NEWNET;
  if (unshare(flags) == -1) return fail("unshare");
  if (!MakeFilesystemReadOnly()) return fail("mount_setattr");
  if (!options_->deny_file_writes) {
    // A new bind mount of the root is writable again.
    const char* root = options_->root.c_str();
    if (mount(root, root, nullptr, MS_BIND, nullptr) == -1) {
      return fail("mount");
    }
  }
  // The working directory still points to the mount below the new one.
  if (chdir(options_->root.c_str()) == -1) return fail("chdir");
  return true;
}

namespace {
Sandbox::Register<Linux> r;
}  // namespace

}  // namespace sandbox
