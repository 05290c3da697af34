#include "SubprocessUtils.hpp"

namespace tabby {
string SubprocessUtils::SubprocessToString(const string& command,
                                           const vector<string>& args,
                                           int* exitStatus) {
  int link_client[2];
  char buf_client[4096];
  if (pipe(link_client) == -1) {
    throw std::runtime_error(string("pipe() failed: ") + strerror(GetErrno()));
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_client[1], STDOUT_FILENO);
    int devNull = open("/dev/null", O_RDWR);
    if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
      dup2(devNull, STDIN_FILENO);
    }
    close(link_client[0]);
    close(link_client[1]);

    vector<char*> argsArray;
    argsArray.push_back(strdup(command.c_str()));
    for (const auto& arg : args) {
      argsArray.push_back(strdup(arg.c_str()));
    }
    argsArray.push_back(NULL);
    execvp(command.c_str(), argsArray.data());
    // Only reached if exec failed; nothing here may touch the logger
    _exit(127);
  } else if (pid < 0) {
    auto localErrno = GetErrno();
    close(link_client[0]);
    close(link_client[1]);
    throw std::runtime_error(string("fork() failed: ") + strerror(localErrno));
  }

  close(link_client[1]);
  string output;
  while (true) {
    int nbytes = read(link_client[0], buf_client, sizeof(buf_client));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    output.append(buf_client, nbytes);
  }
  close(link_client[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      STERROR << "waitpid failed for " << command << ": "
              << strerror(GetErrno());
      status = -1;
      break;
    }
  }
  if (exitStatus) {
    *exitStatus = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status)
                                                       : -1;
  }
  VLOG(2) << "Ran " << command << " (" << args.size() << " args), "
          << output.size() << " bytes of output";
  return output;
}
}  // namespace tabby
