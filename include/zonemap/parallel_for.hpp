#pragma once

#include <algorithm>
#include <exception>
#include <thread>
#include <vector>

namespace zonemap {

/// Automates the cutting of an index range to be processed in threads.
///
/// Each thread receives one contiguous partition [start, stop). Workers must
/// only write to slots of their own partition so that the result does not
/// depend on the completion order.
///
/// @param[in] worker Lambda function called in each thread launched. Lambda
/// function must have the following signature:
/// @code
/// void worker(size_t start, size_t stop);
/// @endcode
/// @param[in] size Size of the range to be processed
/// @param[in] num_threads The number of threads to use for the computation. If
/// 0 all CPUs are used. If 1 is given, no parallel computing code is used at
/// all, which is useful for debugging.
/// @param[in] min_size The minimum size of the range to be processed in
/// parallel. If the size is less than this value, the range is processed
/// sequentially. Default is 1.
/// @throw The exception of the lowest partition that failed, once all
/// threads have completed.
/// @tparam Lambda Lambda function
template <typename Lambda>
void parallel_for(Lambda worker, size_t size, size_t num_threads,
                  size_t min_size = 1) {
  if (num_threads == 0) {
    num_threads = std::max<size_t>(std::thread::hardware_concurrency(), 1);
  }
  num_threads = std::min(num_threads, std::max<size_t>(size, 1));

  if (num_threads == 1 || size <= min_size) {
    worker(0, size);
    return;
  }

  // One slot per partition, so no synchronisation is needed.
  std::vector<std::exception_ptr> exceptions(num_threads);
  std::vector<std::thread> threads;
  threads.reserve(num_threads);

  size_t shift = size / num_threads;
  size_t remainder = size % num_threads;
  size_t start = 0;

  for (size_t ix = 0; ix < num_threads; ++ix) {
    size_t end = start + shift + (ix < remainder ? 1 : 0);
    auto &slot = exceptions[ix];
    threads.emplace_back([worker, start, end, &slot]() mutable {
      try {
        worker(start, end);
      } catch (...) {
        slot = std::current_exception();
      }
    });
    start = end;
  }

  for (auto &thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  for (auto &exception : exceptions) {
    if (exception) {
      std::rethrow_exception(exception);
    }
  }
}

}  // namespace zonemap
