#ifndef __TABBY_HEADERS__
#define __TABBY_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#if __APPLE__
#include <sys/ucred.h>
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#include <sys/socket.h>
#endif

#include <arpa/inet.h>
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <pwd.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <list>
#include <locale>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Tabby.pb.h"
#include "base64.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Largest single line accepted on the wire.  Render frames carry the whole
// styled sidebar so this is generous.
const size_t MAX_LINE_BYTES = 1024 * 1024;
// Initial capacity of the line reader buffer.
const size_t INITIAL_LINE_BUFFER_BYTES = 64 * 1024;

// Absolute deadline for one framed write to a peer.
const int64_t SOCKET_WRITE_DEADLINE_MS = 1000;

// Renderer connection tuning
const int RENDERER_CONNECT_ATTEMPTS = 10;
const int RENDERER_CONNECT_BACKOFF_MS = 100;
const int RENDERER_RECONNECT_DELAY_MS = 1000;
const int RENDERER_KEEP_ALIVE_MS = 1000;

// Daemon exits after this long without any attached renderer.
const int DAEMON_IDLE_SHUTDOWN_SECONDS = 30;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef TABBY_VERSION
#define TABBY_VERSION "unknown"
#endif

namespace tabby {
inline std::ostream &operator<<(std::ostream &os,
                                const tabby::SocketEndpoint &se) {
  return os << se.name();
}

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string trimRight(const string &s, const string &chars = " ") {
  auto end = s.find_last_not_of(chars);
  if (end == string::npos) {
    return "";
  }
  return s.substr(0, end + 1);
}

inline string trimSpace(const string &s) {
  static const string whitespace = " \t\r\n\v\f";
  auto start = s.find_first_not_of(whitespace);
  if (start == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

inline int64_t nowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace tabby

#endif  // __TABBY_HEADERS__
