#include <cstdint>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/chunk.hpp"
#include "internal/model/proximity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

using chunkstore::core::ChunkStore;
using chunkstore::util::FromHex;
using chunkstore::util::ToHex;

static void Usage() {
  std::cout << "Usage:\n"
            << "  chunkstorectl <config.yaml> put <address-hex> <data> [mode=upload|sync|request]\n"
            << "  chunkstorectl <config.yaml> get <address-hex>\n"
            << "  chunkstorectl <config.yaml> set <access|sync|remove|pin|unpin> <address-hex>\n"
            << "  chunkstorectl <config.yaml> state <address-hex>\n"
            << "  chunkstorectl <config.yaml> pull <bin> [since] [limit]\n"
            << "  chunkstorectl <config.yaml> gc\n"
            << "  chunkstorectl <config.yaml> stats\n";
}

static int Put(ChunkStore& store, int argc, char** argv) {
  if (argc < 5) {
    Usage();
    return 1;
  }

  chunkstore::model::ModePut mode = chunkstore::model::ModePut::kUpload;
  if (argc >= 6 && !chunkstore::model::ParseModePut(argv[5], &mode)) {
    std::cerr << "unknown put mode: " << argv[5] << "\n";
    return 1;
  }

  const bool existed = store.Put(mode, chunkstore::model::Chunk{FromHex(argv[3]), argv[4]});
  std::cout << (existed ? "exists" : "stored") << "\n";
  return 0;
}

static int Stats(ChunkStore& store) {
  const auto counts = store.Counts();
  std::cout << "gc_size=" << store.GcSize() << " capacity=" << store.Capacity() << " gc_target=" << store.GcTarget() << "\n"
            << "retrievalData=" << counts.retrieval_data << " retrievalAccess=" << counts.retrieval_access << " push=" << counts.push
            << " pull=" << counts.pull << " gc=" << counts.gc << " gcExclude=" << counts.gc_exclude << " pin=" << counts.pin << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[2];

  try {
    auto config = chunkstore::config::ConfigLoader::LoadFromYaml(argv[1]);
    chunkstore::observability::InitializeLogging(config);

    auto  app   = chunkstore::factory::Build(config);
    auto& store = *app.store;

    if (cmd == "put") {
      return Put(store, argc, argv);
    }

    if (cmd == "get" && argc == 4) {
      const auto chunk = store.Get(FromHex(argv[3]));
      std::cout << chunk.data << "\n";
      return 0;
    }

    if (cmd == "set" && argc == 5) {
      chunkstore::model::ModeSet mode;
      if (!chunkstore::model::ParseModeSet(argv[3], &mode)) {
        std::cerr << "unknown set mode: " << argv[3] << "\n";
        return 1;
      }
      store.Set(mode, FromHex(argv[4]));
      std::cout << "ok\n";
      return 0;
    }

    if (cmd == "state" && argc == 4) {
      const auto address = FromHex(argv[3]);
      std::cout << chunkstore::model::ToString(store.State(address)) << " pin_counter=" << store.PinCounter(address)
                << " bin=" << static_cast<int>(store.Bin(address)) << "\n";
      return 0;
    }

    if (cmd == "pull" && argc >= 4) {
      std::uint8_t bin = 0;
      if (!chunkstore::model::ParseBin(argv[3], &bin)) {
        std::cerr << "invalid bin: " << argv[3] << " (expected 0-" << static_cast<int>(chunkstore::model::kMaxPO) << ")\n";
        return 1;
      }
      const auto since = argc >= 5 ? std::stoull(argv[4]) : 0;
      const auto limit = argc >= 6 ? std::stoull(argv[5]) : 0;
      for (const auto& item : store.PullItems(bin, since, 0, limit)) {
        std::cout << item.bin_id << " " << ToHex(item.address) << "\n";
      }
      return 0;
    }

    if (cmd == "gc") {
      std::cout << "collected=" << store.CollectGarbage() << "\n";
      return 0;
    }

    if (cmd == "stats") {
      return Stats(store);
    }

    Usage();
    return 1;
  } catch (const chunkstore::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
