/* @file PlaybackClient.cpp
 * @brief line-framed JSON commands to the remote player and inbound event decoding
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/Logging.hpp"
#include "core/PlaybackClient.hpp"

using namespace vibedj::core;

namespace {
  constexpr std::size_t kMaxCommandBytes = 4096;
}

PlaybackClient::PlaybackClient(std::shared_ptr<ErrorMonitor> errorMonitor,
                               std::unique_ptr<io::SocketChannel> channel, std::string host, std::uint16_t port)
    : errorMonitor_(std::move(errorMonitor)), channel_(std::move(channel)), host_(std::move(host)), port_(port) {
  if (!errorMonitor_)
    throw std::invalid_argument("[PlaybackClient] error monitor is nullptr");
  if (!channel_)
    throw std::invalid_argument("[PlaybackClient] channel is nullptr");
}

void PlaybackClient::connect() {
  std::lock_guard<std::mutex> lock(writeMtx_); // no write may race a reopen
  if (channel_->isOpen())
    return;

  channel_->close(); // the reader only marks a dropped peer; the fd is released here
  if (!channel_->open(host_, port_)) {
    const std::string errMsg = "[PlaybackClient] player " + host_ + ":" + std::to_string(port_) + " connect failed";
    errorMonitor_->notifyFailure(errMsg);
    throw std::runtime_error(errMsg);
  }
  logging::get("playback")->info("connected to player {}:{}", host_, port_);
}

bool PlaybackClient::connected() const { return channel_ && channel_->isOpen(); }

bool PlaybackClient::sendCommand(const protocols::Command& cmd) {
  auto log = logging::get("playback");
  if (!connected()) {
    errorMonitor_->notifyFailure("[PlaybackClient] player not connected");
    log->warn("dropping '{}': player not connected", protocols::toString(cmd.verb));
    return false;
  }

  const auto wire = cmd.toWire();
  if (wire.size() > kMaxCommandBytes) {
    log->error("command '{}' exceeds {} bytes", protocols::toString(cmd.verb), kMaxCommandBytes);
    return false;
  }

  bool ok = false;
  {
    std::lock_guard<std::mutex> lock(writeMtx_);
    ok = channel_->writeLine(wire);
  }
  if (!ok) {
    const std::string errMsg =
        std::string("[PlaybackClient] failed to write '") + protocols::toString(cmd.verb) + "' to player";
    errorMonitor_->notifyFailure(errMsg);
    log->error("{}", errMsg);
    return false;
  }
  log->debug("sent {}", protocols::toString(cmd.verb));
  return true;
}

bool PlaybackClient::play() { return sendCommand(protocols::Command::simple(protocols::PlaybackVerb::Play)); }
bool PlaybackClient::pause() { return sendCommand(protocols::Command::simple(protocols::PlaybackVerb::Pause)); }
bool PlaybackClient::next() { return sendCommand(protocols::Command::simple(protocols::PlaybackVerb::Next)); }
bool PlaybackClient::previous() {
  return sendCommand(protocols::Command::simple(protocols::PlaybackVerb::Previous));
}

bool PlaybackClient::searchAndPlay(const std::string& query) {
  if (query.empty())
    return false;
  return sendCommand(protocols::Command::searchAndPlay(query));
}

bool PlaybackClient::setVolume(double volume) { return sendCommand(protocols::Command::setVolume(volume)); }

bool PlaybackClient::queueNext(const std::string& query) {
  if (query.empty())
    return false;
  return sendCommand(protocols::Command::queueNext(query));
}

std::optional<vibedj::protocols::Response> PlaybackClient::awaitEvent(std::chrono::milliseconds timeout) {
  if (!connected())
    return std::nullopt;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    auto line = channel_->readLine(left);
    if (!line)
      return std::nullopt;
    if (auto ev = protocols::Response::fromWire(*line))
      return ev;
    logging::get("playback")->warn("ignoring malformed player line: {}", line->substr(0, 200));
  }
  return std::nullopt;
}
