#ifndef __TABBY_FAKE_SUBPROCESS_UTILS__
#define __TABBY_FAKE_SUBPROCESS_UTILS__

#include "SubprocessUtils.hpp"

namespace tabby {
/**
 * Records every command instead of running it.  Output for a command is
 * looked up by its first argument (the tmux subcommand).
 */
class FakeSubprocessUtils : public SubprocessUtils {
 public:
  string SubprocessToString(const string& command, const vector<string>& args,
                            int* exitStatus = nullptr) override {
    lock_guard<mutex> guard(fakeMutex);
    vector<string> call = {command};
    call.insert(call.end(), args.begin(), args.end());
    calls.push_back(call);
    string key = args.empty() ? command : args[0];
    if (exitStatus) {
      *exitStatus = failing.count(key) ? 1 : 0;
    }
    auto it = outputs.find(key);
    return it == outputs.end() ? string() : it->second;
  }

  void setOutput(const string& subcommand, const string& output) {
    lock_guard<mutex> guard(fakeMutex);
    outputs[subcommand] = output;
  }

  void setFailing(const string& subcommand) {
    lock_guard<mutex> guard(fakeMutex);
    failing.insert(subcommand);
  }

  vector<vector<string>> getCalls() {
    lock_guard<mutex> guard(fakeMutex);
    return calls;
  }

  /** Calls whose tmux subcommand is `subcommand`. */
  vector<vector<string>> callsTo(const string& subcommand) {
    lock_guard<mutex> guard(fakeMutex);
    vector<vector<string>> matching;
    for (const auto& call : calls) {
      if (call.size() > 1 && call[1] == subcommand) {
        matching.push_back(call);
      }
    }
    return matching;
  }

  void clearCalls() {
    lock_guard<mutex> guard(fakeMutex);
    calls.clear();
  }

 protected:
  mutex fakeMutex;
  vector<vector<string>> calls;
  map<string, string> outputs;
  set<string> failing;
};
}  // namespace tabby

#endif  // __TABBY_FAKE_SUBPROCESS_UTILS__
