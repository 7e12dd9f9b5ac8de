#ifndef LEXT_WORKER_POOL_HPP
#define LEXT_WORKER_POOL_HPP

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace lext {

/**
 * @brief Run @p task(i) for i in [0, count) on up to @p workers threads
 *
 * Workers pull indices from a shared atomic counter. The first exception
 * thrown by a task stops the remaining indices from being started and is
 * rethrown on the calling thread after all workers have joined.
 */
template <typename Task>
void parallelFor(size_t count, int workers, Task task) {
  if (count == 0) {
    return;
  }

  int threadCount = std::max(1, std::min<int>(workers, static_cast<int>(count)));
  std::atomic<size_t> index{0};
  std::atomic<bool> stop{false};
  std::exception_ptr firstError;
  std::mutex errorMutex;

  auto worker = [&]() {
    while (!stop.load()) {
      size_t i = index.fetch_add(1);
      if (i >= count) {
        break;
      }
      try {
        task(i);
      } catch (...) {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (!firstError) {
          firstError = std::current_exception();
        }
        stop.store(true);
      }
    }
  };

  if (threadCount == 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (int t = 0; t < threadCount; ++t) {
      threads.emplace_back(worker);
    }
    for (auto &thread : threads) {
      thread.join();
    }
  }

  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

/**
 * @brief Counting gate bounding concurrent use of a heavy resource
 */
class ConcurrencyGate {
public:
  explicit ConcurrencyGate(int slots) : m_available(std::max(1, slots)) {}

  ConcurrencyGate(const ConcurrencyGate &) = delete;
  ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

  void acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_released.wait(lock, [this] { return m_available > 0; });
    --m_available;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      ++m_available;
    }
    m_released.notify_one();
  }

  /**
   * @brief RAII slot holder
   */
  class Slot {
  public:
    explicit Slot(ConcurrencyGate &gate) : m_gate(gate) { m_gate.acquire(); }
    ~Slot() { m_gate.release(); }
    Slot(const Slot &) = delete;
    Slot &operator=(const Slot &) = delete;

  private:
    ConcurrencyGate &m_gate;
  };

private:
  std::mutex m_mutex;
  std::condition_variable m_released;
  int m_available;
};

} // namespace lext

#endif // LEXT_WORKER_POOL_HPP
