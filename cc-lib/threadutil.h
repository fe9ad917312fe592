#ifndef _CC_LIB_THREADUTIL_H
#define _CC_LIB_THREADUTIL_H

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

// Parallel comprehension. Runs f on 0...(num-1), using up to
// max_concurrency threads. Each thread claims one index at a time,
// which is appropriate when there are few items and each is
// expensive (e.g. scoring candidate QR masks). With max_concurrency
// of 1 or less, runs on the calling thread.
template<class F>
void ParallelComp(int64_t num,
                  const F &f,
                  int max_concurrency) {
  if (num <= 0) return;
  max_concurrency = (int)std::min(num, (int64_t)max_concurrency);
  if (max_concurrency <= 1) {
    for (int64_t i = 0; i < num; i++) (void)f(i);
    return;
  }

  std::mutex index_m;
  int64_t next_index = 0;

  // Thread applies f repeatedly until there are no more indices.
  auto th = [&index_m, &next_index, num, &f]() {
    for (;;) {
      int64_t my_index = 0;
      {
        std::unique_lock<std::mutex> ul(index_m);
        if (next_index == num) {
          // All done. Don't increment counter so that other threads can
          // notice this too.
          return;
        }
        my_index = next_index++;
      }

      // Do work, not holding mutex.
      (void)f(my_index);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(max_concurrency);
  for (int i = 0; i < max_concurrency; i++) {
    threads.emplace_back(th);
  }
  // Now just wait for them all to finish.
  for (std::thread &t : threads) t.join();
}

// Drop-in serial replacement for debugging, etc.
template<class F>
void UnParallelComp(int64_t num, const F &f, int max_concurrency_ignored) {
  for (int64_t i = 0; i < num; i++) (void)f(i);
}

// Generate the vector containing {f(0), f(1), ..., f(num - 1)}.
// The result type must be default-constructible. Each slot has
// exactly one writer.
template<class F>
auto ParallelTabulate(int64_t num,
                      const F &f,
                      int max_concurrency) ->
  std::vector<decltype(f((int64_t)0))> {
  using R = decltype(f((int64_t)0));
  static_assert(std::is_default_constructible<R>::value,
                "result must be default constructible");
  std::vector<R> result;
  result.resize(num);
  R *data = result.data();
  auto run_write = [data, &f](int64_t idx) {
                     data[idx] = f(idx);
                   };
  ParallelComp(num, run_write, max_concurrency);
  return result;
}

#endif
