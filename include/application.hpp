// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_APPLICATION_HPP
#define LUNACHAIN_APPLICATION_HPP

#include "chain/chainparams.hpp"
#include "mempool/txmempool.hpp"
#include "mining/miner.hpp"
#include "util/files.hpp"
#include "node/inbound_router.hpp"
#include "validation/chainstate_manager.hpp"
#include "wallet/wallet.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace lunachain {
namespace app {

// Daemon configuration, filled from the command line
struct AppConfig {
  std::filesystem::path datadir = util::get_default_datadir();
  chain::ChainType chain_type = chain::ChainType::MAIN;

  bool mine = false;
  int mining_threads = 1;
  std::string miner_address; // empty = a fresh wallet key

  size_t mempool_size = mempool::DEFAULT_MAX_MEMPOOL_ENTRIES;
  size_t verify_threads = 0; // 0 = hardware threads
  size_t router_threads = 2;

  std::chrono::seconds save_interval{600};
  std::chrono::seconds orphan_sweep_interval{60};
};

/**
 * Application - owns every node component and the daemon lifecycle
 *
 * initialize() builds the chain (loading the saved state if present),
 * mempool, wallet, inbound router and miner. start() arms SIGINT/SIGTERM
 * handling and the periodic save and orphan sweep timers;
 * wait_for_shutdown() runs the io_context until a signal or
 * request_shutdown() arrives, then saves and tears everything down.
 */
class Application {
public:
  explicit Application(const AppConfig &config);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();
  void request_shutdown();

  validation::ChainstateManager &chainstate_manager() {
    return *chainstate_manager_;
  }
  mempool::CTxMemPool &mempool() { return *mempool_; }
  wallet::Wallet &wallet() { return *wallet_; }
  node::InboundRouter &router() { return *router_; }
  const chain::ChainParams &chain_params() const { return *chain_params_; }

  bool is_running() const { return running_; }

private:
  bool init_datadir();
  bool init_chain();
  bool init_miner();

  void setup_signal_handlers();
  void schedule_save();
  void schedule_orphan_sweep();
  void save_state();
  void shutdown();

  std::filesystem::path state_file() const {
    return config_.datadir / "chainstate.json";
  }

  AppConfig config_;

  boost::asio::io_context io_context_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer save_timer_;
  boost::asio::steady_timer orphan_timer_;

  // Components, in construction order
  std::unique_ptr<chain::ChainParams> chain_params_;
  std::unique_ptr<validation::ChainstateManager> chainstate_manager_;
  std::unique_ptr<mempool::CTxMemPool> mempool_;
  std::unique_ptr<wallet::Wallet> wallet_;
  std::unique_ptr<node::InboundRouter> router_;
  std::unique_ptr<mining::CPUMiner> miner_;

  std::atomic<bool> running_{false};
};

} // namespace app
} // namespace lunachain

#endif // LUNACHAIN_APPLICATION_HPP
