#ifndef RUNBOX_BOOTSTRAP_H_
#define RUNBOX_BOOTSTRAP_H_

#include <string>
#include <vector>

#include <runbox/executor.h>

// The runner program handed to the interpreter. It reads the submission from
// stdin, executes it with only the allowed builtins visible, captures what the
// submission prints, and writes one JSON object on kResultChannelFd:
//   {"stdout": str, "stderr": str, "truncated": bool,
//    "error": str|null, "traceback": str}
extern const char kWorkerBootstrap[];

std::vector<std::string> WorkerCommand(const ExecutorOptions&);
std::vector<std::string> WorkerEnvs();

#endif  // RUNBOX_BOOTSTRAP_H_
