#include "migration/scheduler/LfsCommand.h"

#include <cerrno>
#include <folly/String.h>
#include <folly/Subprocess.h>
#include <folly/logging/xlog.h>
#include <unistd.h>

namespace ostmig::migration {

Result<String> runLfs(const String &lfsPath, const std::vector<String> &args, status_code_t code) {
  std::vector<String> command;
  command.reserve(args.size() + 1);
  command.push_back(lfsPath);
  command.insert(command.end(), args.begin(), args.end());
  auto cmdline = folly::join(" ", command);

  try {
    auto subprocess = folly::Subprocess(command, folly::Subprocess::Options().pipeStdout());
    String output;
    while (true) {
      char buf[4096];
      ssize_t rsize = ::read(subprocess.stdoutFd(), buf, sizeof(buf));
      if (rsize == 0) {
        break;
      } else if (rsize < 0) {
        if (errno == EINTR) {
          continue;
        }
        XLOGF(ERR, "Failed to run {}, read from stdout failed, errno {}", cmdline, errno);
        subprocess.wait();
        return MAKE_ERROR_F(code, "read stdout of `{}` failed, errno {}", cmdline, errno);
      }
      output.append(&buf[0], &buf[rsize]);
    }

    auto ret = subprocess.wait();
    if (!ret.exited() || ret.exitStatus() != 0) {
      XLOGF(ERR, "Failed to run {}: {}", cmdline, ret.str());
      return MAKE_ERROR_F(code, "`{}` {}", cmdline, ret.str());
    }
    return output;
  } catch (const folly::SubprocessSpawnError &e) {
    XLOGF(ERR, "Failed to spawn {}: {}", cmdline, e.what());
    return MAKE_ERROR_F(code, "spawn `{}` failed: {}", cmdline, e.what());
  }
}

}  // namespace ostmig::migration
