#pragma once

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <thread>

#define TEST_ASSERT(cond)                                                      \
  do {                                                                         \
    if (!(cond)) {                                                             \
      fprintf(stderr, "[FATAL] Assertion failed at %s:%d: %s\n", __FILE__,   \
              __LINE__, #cond);                                                \
      abort();                                                                 \
    }                                                                          \
  } while (0)

#define TEST_ASSERT_EQ_UINT(actual, expected)                                  \
  do {                                                                         \
    const unsigned long _a = (unsigned long)(actual);                          \
    const unsigned long _e = (unsigned long)(expected);                        \
    if (_a != _e) {                                                            \
      fprintf(stderr,                                                          \
              "[FATAL] Assertion failed at %s:%d: %s == %s (got %lu, exp %lu)\n", \
              __FILE__, __LINE__, #actual, #expected, _a, _e);                 \
      abort();                                                                 \
    }                                                                          \
  } while (0)

#define TEST_ASSERT_EQ_STR(actual, expected)                                   \
  do {                                                                         \
    const std::string _a = (actual);                                           \
    const std::string _e = (expected);                                         \
    if (_a != _e) {                                                            \
      fprintf(stderr,                                                          \
              "[FATAL] Assertion failed at %s:%d: %s == %s (got '%s', exp '%s')\n", \
              __FILE__, __LINE__, #actual, #expected, _a.c_str(), _e.c_str()); \
      abort();                                                                 \
    }                                                                          \
  } while (0)

// Polls `cond` until it holds or `timeoutMs` elapses.
static inline bool test_wait_until(const std::function<bool()>& cond, int timeoutMs) {
  const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < until) {
    if (cond()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return cond();
}
