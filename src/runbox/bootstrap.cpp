#include "bootstrap.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include "sandbox.h"

const char kWorkerBootstrap[] = R"(import builtins, io, json, os, sys, traceback
names = [n for n in sys.argv[1].split(',') if n]
limit = int(sys.argv[2])
channel_fd = int(sys.argv[3])
source = sys.stdin.buffer.read().decode('utf-8', 'replace')
env = {
    '__builtins__': {n: getattr(builtins, n) for n in names if hasattr(builtins, n)},
    '__name__': '__main__',
}
result = {'error': None, 'traceback': '', 'truncated': False}
out, err = io.StringIO(), io.StringIO()
sys.stdout, sys.stderr = out, err
try:
    exec(compile(source, '<submission>', 'exec'), env)
except BaseException as e:
    result['error'] = type(e).__name__ + ': ' + str(e)
    result['traceback'] = traceback.format_exc()
finally:
    sys.stdout, sys.stderr = sys.__stdout__, sys.__stderr__

def cap(text):
    data = text.encode('utf-8', 'replace')
    if limit and len(data) > limit:
        result['truncated'] = True
        return data[:limit].decode('utf-8', 'ignore')
    return text

result['stdout'] = cap(out.getvalue())
result['stderr'] = cap(err.getvalue())
with os.fdopen(channel_fd, 'w', encoding='utf-8') as channel:
    json.dump(result, channel)
)";

std::vector<std::string> WorkerCommand(const ExecutorOptions& opt) {
  return {
    opt.interpreter,
    "-I", // isolated: ignore PYTHON* variables and the user site directory
    "-S", // no site module
    "-B",
    "-X", "utf8",
    "-c", kWorkerBootstrap,
    fmt::format("{}", fmt::join(opt.allowed_builtins, ",")),
    std::to_string(opt.max_output),
    std::to_string(kResultChannelFd),
  };
}

std::vector<std::string> WorkerEnvs() {
  return {"LC_ALL=C.UTF-8"};
}
