#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/CacheManager.hpp"
#include "core/ExpirationSweeper.hpp"
#include "core/MaintenanceScheduler.hpp"
#include "core/Resolver.hpp"
#include "core/ThreadPool.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/IRecordStore.hpp"
#include "dal/MemoryRecordStore.hpp"
#include "dal/RecordRepository.hpp"
#include "server/UdpServer.hpp"
#include "upstream/UdpUpstream.hpp"

namespace {

volatile std::sig_atomic_t g_iShutdown = 0;

void onSignal(int /*iSignal*/) {
  g_iShutdown = 1;
}

}  // namespace

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = dnscache::common::Config::load();

    dnscache::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = dnscache::common::Logger::get();
    spLog->info("Step 1: Configuration loaded successfully");

    // ── Step 2: Record store ─────────────────────────────────────────────
    std::unique_ptr<dnscache::dal::ConnectionPool> upPool;
    std::unique_ptr<dnscache::dal::IRecordStore> upStore;
    if (cfgApp.oDbUrl) {
      upPool = std::make_unique<dnscache::dal::ConnectionPool>(*cfgApp.oDbUrl,
                                                               cfgApp.iDbPoolSize);
      auto upRepo = std::make_unique<dnscache::dal::RecordRepository>(*upPool);
      upRepo->ensureSchema();
      upStore = std::move(upRepo);
      spLog->info("Step 2: PostgreSQL record store ready (pool size={})", cfgApp.iDbPoolSize);
    } else {
      upStore = std::make_unique<dnscache::dal::MemoryRecordStore>();
      spLog->warn("Step 2: DNSCACHE_DB_URL not set; records will not survive a restart");
    }

    // ── Step 3: Cache and eager prune before the first lookup ────────────
    auto cmCache = std::make_unique<dnscache::core::CacheManager>(cfgApp.iCacheShards);
    auto esSweeper = std::make_unique<dnscache::core::ExpirationSweeper>(*upStore, *cmCache);
    const auto srStartup = esSweeper->sweep();
    spLog->info("Step 3: Startup prune removed {} expired rows", srStartup.iStoreRowsPruned);

    // ── Step 4: Upstream and resolver ────────────────────────────────────
    auto uuUpstream = std::make_unique<dnscache::upstream::UdpUpstream>(
        cfgApp.sUpstreamAddr, static_cast<uint16_t>(cfgApp.iUpstreamPort));
    auto rsResolver = std::make_unique<dnscache::core::Resolver>(
        *cmCache, *upStore, *uuUpstream, std::chrono::milliseconds(cfgApp.iUpstreamTimeoutMs));
    spLog->info("Step 4: Resolver ready (upstream={}, timeout={}ms)", uuUpstream->name(),
                cfgApp.iUpstreamTimeoutMs);

    // ── Step 5: MaintenanceScheduler ─────────────────────────────────────
    auto msScheduler = std::make_unique<dnscache::core::MaintenanceScheduler>();
    msScheduler->schedule("expiration-sweep",
                          std::chrono::seconds(cfgApp.iPruneIntervalSeconds),
                          [&esSweeper]() { esSweeper->sweep(); });
    msScheduler->start();
    spLog->info("Step 5: MaintenanceScheduler started (expiration sweep every {}s)",
                cfgApp.iPruneIntervalSeconds);

    // ── Step 6: Worker pool and listener ─────────────────────────────────
    auto tpPool = std::make_unique<dnscache::core::ThreadPool>(cfgApp.iWorkerThreads);
    auto usServer = std::make_unique<dnscache::server::UdpServer>(*rsResolver, *tpPool);
    usServer->start(cfgApp.sListenAddr, static_cast<uint16_t>(cfgApp.iListenPort));
    spLog->info("Step 6: dns-cache serving on {}:{} with {} workers", cfgApp.sListenAddr,
                usServer->boundPort(), tpPool->size());

    // ── Step 7: Run until SIGINT / SIGTERM ───────────────────────────────
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (g_iShutdown == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // Graceful shutdown
    spLog->info("Shutdown requested");
    usServer->stop();
    tpPool->shutdown();
    msScheduler->stop();
    const auto csFinal = cmCache->stats();
    spLog->info("dns-cache stopped (hits={}, misses={}, entries={})", csFinal.uHits,
                csFinal.uMisses, csFinal.uEntries);
    dnscache::common::Logger::shutdown();

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
