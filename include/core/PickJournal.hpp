#pragma once
/** @file  PickJournal.hpp
 *  @brief Asynchronous CSV journal of queued picks (runs its own worker thread).
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "core/AudioFeatures.hpp"
#include "core/TimeUtil.hpp"

namespace vibedj {
  namespace core {

    /// One journal row.
    struct PickEvent {
      TimePoint when{};
      std::string source; ///< "selector" | "backup" | "direct"
      std::string title;
      std::string artist;
      std::string searchQuery;
      std::string reasoning;
      double score{ 1.0 };
      double probability{ 100.0 };
      std::string contextBlock;
      AudioTargets targets;
    };

    template <typename T> class BlockingQueue; // forward decl to avoid heavy include

    /**
 * @class PickJournal
 * @brief `log()` never blocks the coordinator; the worker appends rows via io::FileLogger.
 */
    class PickJournal {

    public:
      PickJournal();
      ~PickJournal(); ///< finishRun()

      // --- public API ---
      /** Open \p path for append + launch worker thread. Throws std::runtime_error if unwritable. */
      void startNewRun(const std::string& path);
      void log(PickEvent event); ///< enqueue event (non-blocking); dropped when not running
      void finishRun();          ///< flush + join worker thread

      bool running() const { return running_; }

      /// Header row, and one CSV row with RFC-4180 quoting.
      static std::string csvHeader();
      static std::string toCsv(const PickEvent& event);

      PickJournal(const PickJournal&) = delete;
      PickJournal& operator=(const PickJournal&) = delete;

    private:
      void workerLoop(std::string path, bool writeHeader);

      std::unique_ptr<BlockingQueue<PickEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace vibedj
