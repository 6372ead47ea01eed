// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "crypto/randomx_pow.hpp"
#include "crypto/sha256.hpp"
#include "util/logging.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <randomx.h>
#include <stdexcept>
#include <string>

namespace lunachain {
namespace crypto {

namespace {

struct CacheDeleter {
  void operator()(randomx_cache *cache) const { randomx_release_cache(cache); }
};
struct VMDeleter {
  void operator()(randomx_vm *vm) const { randomx_destroy_vm(vm); }
};

using CachePtr = std::shared_ptr<randomx_cache>;

// A VM must not outlive the cache it was created from
struct ThreadVM {
  CachePtr cache;
  std::unique_ptr<randomx_vm, VMDeleter> vm;
};

std::mutex g_mutex;
bool g_initialized = false;
size_t g_max_caches = DEFAULT_RANDOMX_VM_CACHE_SIZE;
// epoch -> cache; the lowest epoch is evicted first. Guarded by g_mutex.
std::map<uint32_t, CachePtr> g_caches;

thread_local std::map<uint32_t, ThreadVM> t_vms;

CachePtr GetEpochCache(uint32_t nEpoch, randomx_flags flags) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    throw std::runtime_error("RandomX not initialized");
  }
  auto it = g_caches.find(nEpoch);
  if (it != g_caches.end()) {
    return it->second;
  }

  CachePtr cache(randomx_alloc_cache(flags), CacheDeleter());
  if (!cache) {
    throw std::runtime_error("Failed to allocate RandomX cache");
  }
  const uint256 seed = GetSeedHash(nEpoch);
  randomx_init_cache(cache.get(), seed.data(), seed.size());

  while (g_caches.size() >= g_max_caches) {
    g_caches.erase(g_caches.begin());
  }
  g_caches.emplace(nEpoch, cache);
  LOG_CRYPTO_INFO("Created RandomX cache for epoch {}", nEpoch);
  return cache;
}

randomx_vm *GetThreadVM(uint32_t nEpoch) {
  auto it = t_vms.find(nEpoch);
  if (it != t_vms.end()) {
    return it->second.vm.get();
  }

  const randomx_flags flags = randomx_get_flags();
  ThreadVM entry;
  entry.cache = GetEpochCache(nEpoch, flags);
  entry.vm.reset(randomx_create_vm(flags, entry.cache.get(), nullptr));
  if (!entry.vm) {
    throw std::runtime_error("Failed to create RandomX VM");
  }

  while (t_vms.size() >= g_max_caches) {
    t_vms.erase(t_vms.begin());
  }
  randomx_vm *vm = entry.vm.get();
  t_vms.emplace(nEpoch, std::move(entry));
  LOG_CRYPTO_DEBUG("Created thread-local RandomX VM for epoch {}", nEpoch);
  return vm;
}

} // namespace

uint32_t GetEpoch(uint32_t nTime, uint32_t nDuration) {
  return nDuration == 0 ? 0 : nTime / nDuration;
}

uint256 GetSeedHash(uint32_t nEpoch) {
  const std::string seed = "LunaChain/RandomX/Epoch/" + std::to_string(nEpoch);
  return SHA256d(reinterpret_cast<const unsigned char *>(seed.data()),
                 seed.size());
}

void InitRandomX(int vmCacheSize) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_initialized) {
    return;
  }
  g_max_caches = vmCacheSize < 1 ? 1 : static_cast<size_t>(vmCacheSize);
  g_initialized = true;
  LOG_CRYPTO_INFO("RandomX initialized (cache size: {})", g_max_caches);
}

void ShutdownRandomX() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    return;
  }
  g_caches.clear();
  g_initialized = false;
  LOG_CRYPTO_INFO("RandomX shutdown complete");
}

bool IsRandomXInitialized() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_initialized;
}

uint256 CalculateRandomXHash(const uint8_t *data, size_t len, uint32_t nEpoch) {
  randomx_vm *vm = GetThreadVM(nEpoch);
  uint256 out;
  randomx_calculate_hash(vm, data, len, out.data());
  return out;
}

} // namespace crypto
} // namespace lunachain
