#ifndef SANDBOX_LINUX_HPP
#define SANDBOX_LINUX_HPP
#include "sandbox/unix.hpp"

namespace sandbox {

// Unix sandbox that also drops the ability to gain privileges and runs the
// program in its own user and mount namespaces, where the whole filesystem is
// read-only except for the root of the execution (unless file writes are
// denied). When requested, the program is also moved to an empty network
// namespace. Only available when unprivileged user namespaces can be created.
class Linux : public Unix {
 public:
  static Sandbox* Create() { return new Linux(); }
  static int Score();
  bool SupportsIsolation() const override { return true; }

 protected:
  Linux() = default;
  bool OnChild(char* error_msg, size_t buflen) override;
};

}  // namespace sandbox
#endif
