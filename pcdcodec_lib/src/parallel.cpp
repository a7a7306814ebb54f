/*
 * Copyright 2025 Davide Faconti
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "pcdcodec/parallel.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <vector>

namespace PcdCodec {

size_t DefaultThreadsCount() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<size_t>(hw);
}

void ParallelFor(size_t count, size_t num_threads, const std::function<void(size_t, size_t)>& func) {
  if (count == 0) {
    return;
  }
  if (num_threads == 0) {
    num_threads = DefaultThreadsCount();
  }
  num_threads = std::min(num_threads, count);

  if (num_threads == 1) {
    func(0, count);
    return;
  }

  const size_t chunk = count / num_threads;
  const size_t remainder = count % num_threads;

  std::vector<std::exception_ptr> errors(num_threads);
  std::vector<std::thread> workers;
  workers.reserve(num_threads - 1);

  auto run_range = [&](size_t index, size_t begin, size_t end) {
    try {
      func(begin, end);
    } catch (...) {
      // stored and rethrown after the join
      errors[index] = std::current_exception();
    }
  };

  size_t begin = 0;
  size_t first_end = 0;
  for (size_t i = 0; i < num_threads; ++i) {
    const size_t end = begin + chunk + (i < remainder ? 1 : 0);
    if (i == 0) {
      first_end = end;
    } else {
      try {
        workers.emplace_back(run_range, i, begin, end);
      } catch (const std::system_error&) {
        // the system refused a new thread: this range runs here instead
        run_range(i, begin, end);
      }
    }
    begin = end;
  }

  run_range(0, 0, first_end);

  for (auto& worker : workers) {
    worker.join();
  }

  for (const auto& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

}  // namespace PcdCodec
