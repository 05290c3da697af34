#include "DaemonCreator.hpp"

namespace tabby {
int DaemonCreator::create(bool terminateParent) {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }
  if (pid > 0) {
    if (terminateParent) {
      exit(EXIT_SUCCESS);
    }
    return PARENT;
  }

  if (setsid() < 0) {
    _exit(EXIT_FAILURE);
  }
  signal(SIGHUP, SIG_IGN);

  // Second fork so we can never reacquire a controlling terminal
  pid = fork();
  if (pid < 0) {
    _exit(EXIT_FAILURE);
  }
  if (pid > 0) {
    _exit(EXIT_SUCCESS);
  }

  if (chdir("/") == -1) {
    return -1;
  }

  int fd = open("/dev/null", O_RDWR);
  if (fd < 0) {
    return -1;
  }
  dup2(fd, STDIN_FILENO);
  dup2(fd, STDOUT_FILENO);
  dup2(fd, STDERR_FILENO);
  if (fd > STDERR_FILENO) {
    close(fd);
  }
  return CHILD;
}
}  // namespace tabby
