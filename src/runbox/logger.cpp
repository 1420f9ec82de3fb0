#include <runbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Parent() {
  spdlog::details::console_mutex::mutex().unlock();
}

void Child() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
