#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-only line writer for journals on the host FS.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace vibedj {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file for append, buffers writes, and flushes on demand.
 *
 *  * Uses `std::fwrite` in 4 kB chunks.
 *  * Not thread-safe; owned by one writer thread.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkBytes = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened for appending. */
      bool open(const std::string& path);

      bool isOpen() const { return fp_ != nullptr; }

      /** True when the opened file held no bytes before this run. */
      bool wasEmpty() const { return wasEmpty_; }

      /** Queues one line (caller includes trailing '\n'); spills a full chunk to disk. */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      std::FILE* fp_{ nullptr };
      std::vector<char> buffer_;
      bool wasEmpty_{ false };
    };

  } // namespace io
} // namespace vibedj
