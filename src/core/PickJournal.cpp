/* @file PickJournal.cpp
 * @brief journal worker thread and CSV row formatting
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <sstream>
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/EventQueue.hpp"
#include "core/Logging.hpp"
#include "core/PickJournal.hpp"
#include "io/FileLogger.hpp"

using namespace vibedj::core;

namespace {

  std::string quote(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos)
      return field;
    std::string out = "\"";
    for (char c : field) {
      if (c == '"')
        out += '"';
      out += c;
    }
    return out + '"';
  }

  std::string fixed(double v, int precision) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(precision);
    os << v;
    return os.str();
  }

} // namespace

PickJournal::PickJournal() : buffer_(std::make_unique<BlockingQueue<PickEvent>>()) {}

PickJournal::~PickJournal() { finishRun(); }

std::string PickJournal::csvHeader() {
  std::string h = "time_utc,source,title,artist,search_query,score,probability,context_block";
  for (auto f : kAllFeatures) {
    h += ',';
    h += toString(f);
  }
  return h + ",reasoning\n";
}

std::string PickJournal::toCsv(const PickEvent& e) {
  std::string row = toIsoUtc(e.when) + ',' + quote(e.source) + ',' + quote(e.title) + ',' + quote(e.artist) + ',' +
                    quote(e.searchQuery) + ',' + fixed(e.score, 4) + ',' + fixed(e.probability, 1) + ',' +
                    quote(e.contextBlock);
  for (auto f : kAllFeatures)
    row += ',' + std::to_string(e.targets.get(f));
  return row + ',' + quote(e.reasoning) + '\n';
}

void PickJournal::startNewRun(const std::string& path) {
  if (running_)
    return;

  // Open once here so an unwritable path fails at startup rather than on the worker.
  io::FileLogger probe;
  if (!probe.open(path))
    throw std::runtime_error("[PickJournal] cannot open journal: " + path);
  const bool writeHeader = probe.wasEmpty();
  probe.close();

  running_ = true;
  worker_ = std::thread(&PickJournal::workerLoop, this, path, writeHeader);
  logging::get("app")->info("pick journal -> {}", path);
}

void PickJournal::log(PickEvent event) {
  if (!running_)
    return;
  buffer_->push(std::move(event));
}

void PickJournal::finishRun() {
  if (!running_.exchange(false))
    return;
  if (worker_.joinable())
    worker_.join();
}

void PickJournal::workerLoop(std::string path, bool writeHeader) {
  io::FileLogger file;
  if (!file.open(path)) {
    logging::get("app")->error("pick journal {} became unwritable", path);
    return;
  }
  if (writeHeader)
    file.write(csvHeader());

  // Drain whatever is left after finishRun() flips running_.
  while (true) {
    auto ev = buffer_->popFor(std::chrono::milliseconds(200));
    if (ev) {
      file.write(toCsv(*ev));
      file.flush();
      continue;
    }
    if (!running_)
      break;
  }
  file.close();
}
