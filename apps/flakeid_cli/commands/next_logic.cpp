#include "next_logic.h"

#include "flakeid/core/id_generator.h"
#include "flakeid/domain/decoded_id.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace flakeid::cli {

namespace {

int save_watermark(const core::IdGenerator& generator, storage::IWatermarkStore& store,
                   std::ostream& err) {
  const auto last = generator.last_timestamp_ms();
  if (!last.has_value()) {
    return 0;
  }

  const auto saved = store.save(generator.identity(), last.value());
  if (!saved.has_value()) {
    err << "Error: failed to save watermark: " << saved.error() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int execute_next(const core::NodeIdentity& identity, int count, OutputFormat format,
                 core::IClock& clock, storage::IWatermarkStore& store, std::ostream& out,
                 std::ostream& err) {
  if (count < 1) {
    err << "Error: --count must be at least 1 (got " << count << ")\n";
    return 1;
  }

  const auto watermark = store.load(identity);
  if (!watermark.has_value()) {
    err << "Error: failed to load watermark: " << watermark.error() << "\n";
    return 1;
  }

  auto generator = core::IdGenerator::from_identity(identity, clock, watermark.value());

  std::vector<core::SnowflakeId> ids;
  ids.reserve(static_cast<std::size_t>(count));

  for (int i = 0; i < count; ++i) {
    auto id = generator->next_id();
    if (!id.has_value()) {
      // No retry: a regressed clock needs operator attention, not a loop.
      err << "Error: " << core::to_string(id.error()) << "\n"
          << "       Issued " << ids.size() << " of " << count << " ids before stopping.\n";
      // A save failure is reported by save_watermark; the exit code is 1 either way.
      save_watermark(*generator, store, err);
      return 1;
    }
    ids.push_back(id.value());
  }

  if (save_watermark(*generator, store, err) != 0) {
    // Ids are withheld when the watermark could not be persisted.
    return 1;
  }

  if (format == OutputFormat::kJson) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& id : ids) {
      array.push_back(domain::decoded_id_to_json(id));
    }
    out << array.dump(2) << "\n";
  } else {
    for (const auto& id : ids) {
      out << id.value << "\n";
    }
  }

  return 0;
}

}  // namespace flakeid::cli
