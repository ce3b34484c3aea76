#ifndef TBB_MANAGER_HPP_
#define TBB_MANAGER_HPP_

#include <tbb/tbb.h>

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "flags.hpp"
#include "logger.hpp"

namespace utils {

struct TBBState {
  bool initialized = false;
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
};

/**
 * @brief TBB任务管理器，按名称管理arena
 *
 * 每个名称对应一个独立的 task_arena，并发度由
 * --custom_tbb_parallel_control 控制（如 "reconcile:4"），未配置时使用
 * tbb::info::default_concurrency()。
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name);

  // Runs task(i) for i in [start, end) inside the named arena and returns
  // when all of them are done. A throwing task is logged and does not stop
  // its siblings.
  template <typename IntType, typename Func>
  void ParallelFor(const std::string& tbb_name, IntType start, IntType end,
                   const Func& task);

  void Release();
  ~TBBManager();

  static std::map<std::string, int> ParseParallelControl(
      const std::string& cfg);
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  uint64_t GenerateUniqueTaskId() const;

  std::unordered_map<std::string, TBBState> task_arenas_;
  mutable std::mutex arenas_mutex_;
};

// 模板实现
template <typename IntType, typename Func>
void TBBManager::ParallelFor(const std::string& tbb_name, IntType start,
                             IntType end, const Func& task) {
  if (start >= end) return;

  const uint64_t task_id = GenerateUniqueTaskId();
  auto arena = Init(tbb_name);

  LOG(DEBUG) << "[TBBManager] ParallelFor start: " << tbb_name << "_"
             << task_id << " [" << start << "," << end << ")";
  arena->execute([&task, &tbb_name, start, end]() {
    tbb::parallel_for(
        tbb::blocked_range<IntType>(start, end),
        [&task, &tbb_name](const tbb::blocked_range<IntType>& range) {
          for (IntType i = range.begin(); i < range.end(); ++i) {
            try {
              task(i);
            } catch (const std::exception& e) {
              LOG(ERROR) << "[TBBManager] Exception in " << tbb_name
                         << " task " << i << ": " << e.what();
            }
          }
        });
  });
  LOG(DEBUG) << "[TBBManager] ParallelFor end: " << tbb_name << "_"
             << task_id;
}

}  // namespace utils

#endif  // TBB_MANAGER_HPP_
