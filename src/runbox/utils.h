#ifndef RUNBOX_UTILS_H_
#define RUNBOX_UTILS_H_

#include <unistd.h>
#include <chrono>

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

template <class Duration>
inline long ToUs(Duration d) {
  return std::chrono::duration_cast<std::chrono::microseconds>(d).count();
}

// Async-signal-safe; usable between fork and exec
int CloseFrom(int minfd);

class UniqueFd {
  int fd_;
 public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { Reset(); }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& x) : fd_(x.fd_) { x.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& x) {
    if (this != &x) {
      Reset();
      fd_ = x.fd_;
      x.fd_ = -1;
    }
    return *this;
  }

  int Get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }
  void Reset() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }
};

#endif  // RUNBOX_UTILS_H_
