#pragma once

#include <string>

#include "internal/index/index.hpp"

namespace chunkstore::core {

/*
  Key and value layouts of the chunk indexes. Integers are big-endian.

    retrievalData    address                           -> store_ts | bin_id | data
    retrievalAccess  address                           -> access_ts | store_ts | bin_id
    push             store_ts | address                -> -
    pull             bin | bin_id | address            -> -
    gc               access_ts | bin_id | address      -> -
    gcExclude        address                           -> -
    pin              address                           -> pin_counter
*/

index::IndexFuncs RetrievalDataFuncs();
index::IndexFuncs RetrievalAccessFuncs();
index::IndexFuncs PushFuncs();
// bin is the proximity order of the address against base_address
index::IndexFuncs PullFuncs(std::string base_address);
index::IndexFuncs GcFuncs();
index::IndexFuncs GcExcludeFuncs();
index::IndexFuncs PinFuncs();

} // namespace chunkstore::core
