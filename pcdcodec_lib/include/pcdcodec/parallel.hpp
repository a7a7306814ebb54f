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

#pragma once

#include <cstddef>
#include <functional>

namespace PcdCodec {

/// Number of threads to use when the user asks for 0 (automatic)
size_t DefaultThreadsCount();

/**
 * @brief Split [0, count) into at most `num_threads` contiguous ranges and call
 * `func(begin, end)` once per range. The first range runs in the calling thread, and so does
 * any range whose worker thread can not be started.
 *
 * The call returns when all the ranges are done. If some of them throw, the exception of the
 * range with the lowest index is rethrown, so that errors are deterministic.
 *
 * Ranges must write to disjoint memory: no synchronization is done besides the final join.
 */
void ParallelFor(size_t count, size_t num_threads, const std::function<void(size_t, size_t)>& func);

}  // namespace PcdCodec
