// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "application.hpp"
#include "crypto/key.hpp"
#include "crypto/randomx_pow.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <boost/asio/post.hpp>
#include <csignal>
#include <iostream>

namespace lunachain {
namespace app {

Application::Application(const AppConfig &config)
    : config_(config), signals_(io_context_), save_timer_(io_context_),
      orphan_timer_(io_context_) {}

Application::~Application() { stop(); }

bool Application::initialize() {
  const char *network = "main";
  if (config_.chain_type == chain::ChainType::TESTNET) {
    network = "test";
  } else if (config_.chain_type == chain::ChainType::REGTEST) {
    network = "regtest";
  }
  std::cout << GetStartupBanner(network) << std::flush;

  LOG_APP_INFO("Initializing LunaChain...");

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_chain()) {
    LOG_APP_ERROR("Failed to initialize blockchain");
    return false;
  }

  LOG_APP_INFO("Initializing mempool (capacity {})...", config_.mempool_size);
  mempool_ = std::make_unique<mempool::CTxMemPool>(*chainstate_manager_,
                                                   config_.mempool_size);
  wallet_ = std::make_unique<wallet::Wallet>(*chainstate_manager_, *mempool_);
  router_ = std::make_unique<node::InboundRouter>(
      *chainstate_manager_, *mempool_, config_.router_threads);

  if (!init_miner()) {
    LOG_APP_ERROR("Failed to initialize miner");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting LunaChain...");

  setup_signal_handlers();
  running_ = true;

  schedule_save();
  schedule_orphan_sweep();

  if (config_.mine && miner_) {
    if (!miner_->Start(config_.mining_threads)) {
      LOG_APP_ERROR("Failed to start miner");
      return false;
    }
  }

  LOG_APP_INFO("LunaChain started successfully");
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::request_shutdown() {
  boost::asio::post(io_context_, [this]() { io_context_.stop(); });
}

void Application::wait_for_shutdown() {
  // Timers and the signal set keep the context busy until stopped
  io_context_.run();
  shutdown();
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down LunaChain...");

  save_timer_.cancel();
  orphan_timer_.cancel();
  boost::system::error_code ec;
  signals_.cancel(ec);

  if (miner_ && miner_->IsMining()) {
    LOG_APP_INFO("Stopping miner...");
    miner_->Stop();
  }

  if (router_) {
    LOG_APP_INFO("Draining inbound router...");
    router_->Shutdown();
  }

  save_state();

  if (chain_params_ &&
      chain_params_->GetConsensus().powAlgorithm ==
          crypto::PowAlgorithm::RANDOMX) {
    LOG_APP_INFO("Shutting down RandomX...");
    crypto::ShutdownRandomX();
  }

  LOG_APP_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}",
                  config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_chain() {
  LOG_APP_INFO("Initializing blockchain...");

  chain::ChainSettings settings;
  settings.mempool_max_entries = config_.mempool_size;

  switch (config_.chain_type) {
  case chain::ChainType::MAIN:
    chain_params_ = chain::ChainParams::CreateMainNet(settings);
    break;
  case chain::ChainType::TESTNET:
    chain_params_ = chain::ChainParams::CreateTestNet(settings);
    break;
  case chain::ChainType::REGTEST:
    chain_params_ = chain::ChainParams::CreateRegTest(settings);
    break;
  }
  LOG_APP_INFO("Using {}", chain_params_->GetChainTypeString());

  if (chain_params_->GetConsensus().powAlgorithm ==
      crypto::PowAlgorithm::RANDOMX) {
    LOG_APP_INFO("Initializing RandomX...");
    crypto::InitRandomX(crypto::DEFAULT_RANDOMX_VM_CACHE_SIZE);
  }

  chainstate_manager_ = std::make_unique<validation::ChainstateManager>(
      *chain_params_, config_.verify_threads);

  const std::filesystem::path file = state_file();
  std::error_code ec;
  if (std::filesystem::exists(file, ec)) {
    if (!chainstate_manager_->Load(file.string())) {
      // Never overwrite a state file we could not read
      LOG_APP_ERROR("Chain state in {} is corrupt; refusing to start",
                    file.string());
      return false;
    }
    LOG_APP_INFO("Loaded chain state from disk");
  } else {
    LOG_APP_INFO("No saved chain state found, initializing with genesis block");
    if (!chainstate_manager_->Initialize()) {
      return false;
    }
  }

  LOG_APP_INFO("Blockchain initialized at height: {}",
               chainstate_manager_->GetChainHeight());
  return true;
}

bool Application::init_miner() {
  std::string address = config_.miner_address;
  if (address.empty()) {
    if (!config_.mine) {
      return true;
    }
    auto generated = wallet_->GenerateKey();
    if (!generated) {
      return false;
    }
    address = *generated;
    LOG_APP_INFO("Mining to new wallet address {}", address);
  } else {
    auto normalized = crypto::NormalizeAddress(address);
    if (!normalized) {
      LOG_APP_ERROR("Invalid --miner-address: {}", address);
      return false;
    }
    address = *normalized;
  }

  LOG_APP_INFO("Initializing miner...");
  miner_ = std::make_unique<mining::CPUMiner>(
      *chain_params_, *chainstate_manager_, mempool_.get(), address);
  return true;
}

void Application::setup_signal_handlers() {
  signals_.add(SIGINT);
  signals_.add(SIGTERM);
  signals_.async_wait(
      [this](const boost::system::error_code &ec, int signal_number) {
        if (ec) {
          return;
        }
        LOG_APP_INFO("Received signal {}", signal_number);
        io_context_.stop();
      });
}

void Application::schedule_save() {
  save_timer_.expires_after(config_.save_interval);
  save_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_) {
      return;
    }
    save_state();
    schedule_save();
  });
}

void Application::schedule_orphan_sweep() {
  orphan_timer_.expires_after(config_.orphan_sweep_interval);
  orphan_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_) {
      return;
    }
    size_t evicted = chainstate_manager_->EvictOrphanBlocks();
    if (evicted > 0) {
      LOG_APP_DEBUG("Evicted {} orphan blocks", evicted);
    }
    schedule_orphan_sweep();
  });
}

void Application::save_state() {
  if (!chainstate_manager_) {
    return;
  }

  const std::string file = state_file().string();
  LOG_APP_DEBUG("Saving chain state to {}", file);

  if (!chainstate_manager_->Save(file)) {
    LOG_APP_ERROR("Chain state save failed");
  } else {
    LOG_APP_DEBUG("Chain state saved ({} blocks, height {})",
                  chainstate_manager_->GetBlockCount(),
                  chainstate_manager_->GetChainHeight());
  }
}

} // namespace app
} // namespace lunachain
