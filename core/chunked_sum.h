#ifndef KOMBINE_CHUNKED_SUM_H_
#define KOMBINE_CHUNKED_SUM_H_

#include <algorithm>
#include <cstdint>
#include <future>
#include <vector>

#include "ctpl_stl.h"

namespace kombine {

// Adds up chunk_sum(begin, end) over a split of [0, n) into contiguous chunks.
// Chunk 0 runs on this thread; the rest, if there's a thread pool, run on its threads.
// Every chunk handed to the pool has finished by the time this returns or throws.
template<typename Result, typename Chunk_sum>
auto sum_over_chunks(ctpl::thread_pool* thread_pool, int n, const Chunk_sum& chunk_sum) -> Result {
  auto num_chunks = thread_pool == nullptr ? 1 : std::clamp(thread_pool->size() + 1, 1, std::max(n, 1));
  auto chunk_begin = [n, num_chunks](int c) { return static_cast<int>(int64_t{n} * c / num_chunks); };

  auto chunk_results = std::vector<std::future<Result>>{};

  // Pool tasks refer to `chunk_sum`, so they can't outlive this call even if we bail out early
  struct Wait_for_all {
    std::vector<std::future<Result>>& futures;
    ~Wait_for_all() {
      for (auto& f : futures) {
        if (f.valid()) { f.wait(); }
      }
    }
  } wait_for_all{chunk_results};

  for (auto c = 1; c < num_chunks; ++c) {  // Note: start at 1
    auto begin = chunk_begin(c);
    auto end = chunk_begin(c + 1);
    chunk_results.push_back(thread_pool->push(
        [&chunk_sum, begin, end](int /*thread_id*/) -> Result { return chunk_sum(begin, end); }));
  }

  auto total = Result(chunk_sum(0, chunk_begin(1)));
  for (auto& chunk_result : chunk_results) {
    total += chunk_result.get();
  }
  return total;
}

}  // namespace kombine

#endif // KOMBINE_CHUNKED_SUM_H_
