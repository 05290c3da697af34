#include "SessionPaths.hpp"

namespace tabby {
SessionPaths::SessionPaths() {}

void SessionPaths::setRuntimeDirOverride(const string& dir) {
  runtimeDirOverride = dir;
}

string SessionPaths::getRuntimeDir() const {
  string dir;
  if (runtimeDirOverride) {
    dir = *runtimeDirOverride;
  } else {
    const char* fromEnv = ::getenv("TABBY_RUNTIME_DIR");
    dir = (fromEnv && *fromEnv) ? string(fromEnv) : GetTempDirectory();
  }
  while (dir.size() > 1 && dir.back() == '/') {
    dir.pop_back();
  }
  return dir;
}

string SessionPaths::sanitizeSessionId(const string& sessionId) {
  if (sessionId.empty()) {
    return "default";
  }
  string safe = sessionId;
  for (auto& c : safe) {
    if (!isalnum((unsigned char)c) && c != '_' && c != '.' && c != '-') {
      c = '_';
    }
  }
  return safe;
}

string SessionPaths::socketPath(const string& sessionId) const {
  return getRuntimeDir() + "/tabby-daemon-" + sanitizeSessionId(sessionId) +
         ".sock";
}

string SessionPaths::pidPath(const string& sessionId) const {
  return getRuntimeDir() + "/tabby-daemon-" + sanitizeSessionId(sessionId) +
         ".pid";
}

SocketEndpoint SessionPaths::endpoint(const string& sessionId) const {
  SocketEndpoint endpoint;
  endpoint.set_name(socketPath(sessionId));
  return endpoint;
}
}  // namespace tabby
