#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/chunk_store.hpp"
#include "internal/core/garbage_collector.hpp"
#include "internal/db/api/kv_store.hpp"

namespace chunkstore::factory {

/*
  Application

  Owns all long-lived objects of a running store.
*/
struct Application {
  std::shared_ptr<db::KVStore>             kv_store;
  std::shared_ptr<core::ChunkStore>        store;
  std::shared_ptr<core::GarbageCollector>  garbage_collector;
};

/*
  Composition root: the only place that knows concrete engine types.

  The garbage collector is built but not started.
*/
Application Build(const chunkstore::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::KVStore> BuildKVStore(const chunkstore::runtime::config::RuntimeConfig& config);

} // namespace chunkstore::factory
