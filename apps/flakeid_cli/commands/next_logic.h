#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/node_identity.h"
#include "flakeid/storage/watermark_store.h"

#include <ostream>

namespace flakeid::cli {

enum class OutputFormat {
  kPlain,  // one decimal Id per line
  kJson,   // JSON array of decoded Ids
};

// execute_next issues `count` Ids for identity and writes them to out.
//
// The watermark for identity is loaded from store before the first Id and saved after
// the last one, including when generation stops early on ClockMovedBackwards.
// Takes only interface types; no concrete storage headers may be included in this TU.
//
// Returns: 0 on success, 1 on any error (message written to err).
int execute_next(const core::NodeIdentity& identity, int count, OutputFormat format,
                 core::IClock& clock, storage::IWatermarkStore& store, std::ostream& out,
                 std::ostream& err);

}  // namespace flakeid::cli
