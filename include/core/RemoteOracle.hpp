#pragma once
/** @file  RemoteOracle.hpp
 *  @brief JSON-lines RPC client plus the Vibe and Recommender oracles that ride on it.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// VibeDJ headers
#include "io/SocketChannel.hpp"
#include "protocols/RecommenderOracle.hpp"
#include "protocols/VibeOracle.hpp"

namespace vibedj {
  namespace core {

    /**
 * @class OracleRpcClient
 * @brief `{"id","method","params"}` out, `{"id","result"|"error"}` back, one call at a time.
 *
 *  * Connects lazily and reconnects after a transport failure.
 *  * Replies with a stale id are discarded until the matching one arrives or the call times out.
 *  * Every failure throws `OracleError`.
 */
    class OracleRpcClient {
    public:
      OracleRpcClient(std::unique_ptr<io::SocketChannel> channel, std::string host, std::uint16_t port,
                      std::chrono::milliseconds timeout);

      nlohmann::json call(const std::string& method, const nlohmann::json& params);

    private:
      std::unique_ptr<io::SocketChannel> channel_;
      std::string host_;
      std::uint16_t port_;
      std::chrono::milliseconds timeout_;
      std::uint64_t nextId_{ 1 };
      std::mutex mtx_;
    };

    /// `vibe_check` over the RPC client.
    class RemoteVibeOracle : public protocols::VibeOracle {
    public:
      explicit RemoteVibeOracle(std::shared_ptr<OracleRpcClient> client);
      VibePlan requestPlan(const protocols::VibeRequest& request) override;

    private:
      std::shared_ptr<OracleRpcClient> client_;
    };

    /// `recommend` over the RPC client.
    class RemoteRecommenderOracle : public protocols::RecommenderOracle {
    public:
      explicit RemoteRecommenderOracle(std::shared_ptr<OracleRpcClient> client);
      protocols::Recommendation recommend(const protocols::RecommendRequest& request) override;

    private:
      std::shared_ptr<OracleRpcClient> client_;
    };

  } // namespace core
} // namespace vibedj
