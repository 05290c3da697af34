#include "PidFile.hpp"

namespace tabby {
PidFile::PidFile(const string& _path) : path(_path) {}

bool PidFile::processAlive(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  if (::kill(pid, 0) == 0) {
    return true;
  }
  // EPERM means the process exists but belongs to someone else
  return GetErrno() == EPERM;
}

optional<pid_t> PidFile::readPid() const {
  ifstream in(path);
  if (!in.is_open()) {
    return nullopt;
  }
  long pid = 0;
  if (!(in >> pid) || pid <= 0) {
    return nullopt;
  }
  return pid_t(pid);
}

bool PidFile::exists() const {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

bool PidFile::isOwnedByUs() const {
  auto pid = readPid();
  return pid && *pid == ::getpid();
}

void PidFile::claim() {
  auto existing = readPid();
  if (existing && *existing != ::getpid() && processAlive(*existing)) {
    throw std::runtime_error("daemon already running with pid " +
                             to_string(*existing));
  }
  if (exists()) {
    LOG(INFO) << "Removing stale pid file " << path;
    if (::unlink(path.c_str()) == -1 && GetErrno() != ENOENT) {
      throw std::runtime_error("failed to remove stale pidfile " + path +
                               ": " + strerror(GetErrno()));
    }
  }

  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW,
                  0600);
  if (fd == -1) {
    throw std::runtime_error("failed to write pidfile " + path + ": " +
                             strerror(GetErrno()));
  }
  string pidStr = to_string(::getpid()) + "\n";
  ssize_t written = ::write(fd, pidStr.c_str(), pidStr.length());
  ::close(fd);
  if (written != ssize_t(pidStr.length())) {
    ::unlink(path.c_str());
    throw std::runtime_error("failed to write pidfile " + path);
  }
  VLOG(1) << "Claimed pid file " << path;
}

bool PidFile::release() {
  if (!isOwnedByUs()) {
    VLOG(1) << "Not removing pid file " << path << ": not ours";
    return false;
  }
  if (::unlink(path.c_str()) == -1) {
    STERROR << "Failed to remove pid file " << path << ": "
            << strerror(GetErrno());
    return false;
  }
  return true;
}
}  // namespace tabby
