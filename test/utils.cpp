#include "utils.h"

#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

int CountChildren() {
  int cnt = 0;
  for (auto& task : fs::directory_iterator("/proc/self/task")) {
    std::ifstream fin(task.path() / "children");
    for (int pid; fin >> pid;) cnt++;
  }
  return cnt;
}

bool IsGone(pid_t pid) {
  if (waitpid(pid, nullptr, WNOHANG) != -1 || errno != ECHILD) return false;
  return kill(pid, 0) == -1 && errno == ESRCH;
}

namespace {

bool Running(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  std::string stat;
  if (!std::getline(fin, stat)) return false;
  size_t pos = stat.rfind(')');
  if (pos == std::string::npos || pos + 2 >= stat.size()) return false;
  char state = stat[pos + 2];
  return state != 'Z' && state != 'X';
}

} // namespace

bool Terminated(pid_t pid, int timeout_ms) {
  for (int i = 0; i < timeout_ms; i++) {
    if (!Running(pid)) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return !Running(pid);
}
