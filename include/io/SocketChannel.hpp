#pragma once
/** @file  SocketChannel.hpp
 *  @brief TCP line I/O wrapper (uses poll under the hood).
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vibedj {
  namespace io {

    /**
 * @class SocketChannel
 * @brief RAII wrapper around a single connected TCP socket.
 *
 *  * Frames I/O as lines terminated by `\r\n`; a bare `\n` is accepted on input.
 *  * One reader thread and one writer thread may use it concurrently.
 *  * A peer close seen by `readLine` only marks the channel closed; the descriptor
 *    is released by `close()`/`open()`, which the owner serializes against writes.
 *  * *Non-copyable*, but move-constructible.
 */
    class SocketChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SocketChannel() = default;
      virtual ~SocketChannel(); // close the socket at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& host, std::uint16_t port);
      virtual bool writeLine(const std::string& line); // returns false on EPIPE/EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_.load() >= 0 && !peerClosed_.load(); }
      void close();

      //---non-copyable-----------------------------------------
      SocketChannel(const SocketChannel&) = delete;
      SocketChannel& operator=(const SocketChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SocketChannel(SocketChannel&& other) noexcept;
      SocketChannel& operator=(SocketChannel&& other) noexcept;

    private:
      std::optional<std::string> takeBufferedLine();

      std::atomic<int> fd_{ -1 };           ///< POSIX fd (-1==closed)
      std::atomic<bool> peerClosed_{ false }; ///< EOF seen by the reader, fd still held
      std::string rx_buffer_{};               ///< bytes received past the last complete line
    };
  } // namespace io
} // namespace vibedj
