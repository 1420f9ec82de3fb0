#ifndef INCLUDE_RUNBOX_LOGGER_H_
#define INCLUDE_RUNBOX_LOGGER_H_

// Call once from main before any worker is started. Keeps spdlog's console
// mutex consistent across fork().
void InitLogger();

#endif  // INCLUDE_RUNBOX_LOGGER_H_
