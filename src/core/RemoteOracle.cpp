/* @file RemoteOracle.cpp
 * @brief request/response correlation for the oracle RPC link
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// third-party headers
#include <spdlog/spdlog.h>

// VibeDJ headers
#include "core/Errors.hpp"
#include "core/Logging.hpp"
#include "core/RemoteOracle.hpp"

using namespace vibedj::core;

OracleRpcClient::OracleRpcClient(std::unique_ptr<io::SocketChannel> channel, std::string host, std::uint16_t port,
                                 std::chrono::milliseconds timeout)
    : channel_(std::move(channel)), host_(std::move(host)), port_(port), timeout_(timeout) {
  if (!channel_)
    throw std::invalid_argument("[OracleRpcClient] channel is nullptr");
}

nlohmann::json OracleRpcClient::call(const std::string& method, const nlohmann::json& params) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto log = logging::get("oracle");

  if (!channel_->isOpen() && !channel_->open(host_, port_))
    throw OracleError("[OracleRpcClient] cannot reach oracle at " + host_ + ":" + std::to_string(port_));

  const std::uint64_t id = nextId_++;
  const nlohmann::json request{ { "id", id }, { "method", method }, { "params", params } };
  if (!channel_->writeLine(request.dump())) {
    channel_->close();
    throw OracleError("[OracleRpcClient] failed to send '" + method + "'");
  }

  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + timeout_;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    const auto line = channel_->readLine(left);
    if (!line) {
      if (!channel_->isOpen())
        throw OracleError("[OracleRpcClient] oracle closed the connection during '" + method + "'");
      break;
    }

    const auto reply = nlohmann::json::parse(*line, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
      log->warn("ignoring malformed oracle line: {}", line->substr(0, 200));
      continue;
    }
    const auto rid = reply.find("id");
    if (rid == reply.end() || !rid->is_number_unsigned() || rid->get<std::uint64_t>() != id) {
      log->debug("discarding stale oracle reply");
      continue;
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    if (const auto err = reply.find("error"); err != reply.end() && !err->is_null()) {
      const std::string msg = err->is_string() ? err->get<std::string>() : err->dump();
      throw OracleError("[OracleRpcClient] '" + method + "' failed: " + msg);
    }
    const auto result = reply.find("result");
    if (result == reply.end())
      throw OracleError("[OracleRpcClient] '" + method + "' reply has no result");
    log->info("{} answered in {}ms", method, ms.count());
    return *result;
  }

  throw OracleError("[OracleRpcClient] '" + method + "' timed out after " + std::to_string(timeout_.count()) + "ms");
}

RemoteVibeOracle::RemoteVibeOracle(std::shared_ptr<OracleRpcClient> client) : client_(std::move(client)) {
  if (!client_)
    throw std::invalid_argument("[RemoteVibeOracle] rpc client is nullptr");
}

VibePlan RemoteVibeOracle::requestPlan(const protocols::VibeRequest& request) {
  return parseVibePlan(client_->call("vibe_check", protocols::toJson(request)));
}

RemoteRecommenderOracle::RemoteRecommenderOracle(std::shared_ptr<OracleRpcClient> client)
    : client_(std::move(client)) {
  if (!client_)
    throw std::invalid_argument("[RemoteRecommenderOracle] rpc client is nullptr");
}

vibedj::protocols::Recommendation RemoteRecommenderOracle::recommend(const protocols::RecommendRequest& request) {
  return protocols::parseRecommendation(client_->call("recommend", protocols::toJson(request)));
}
