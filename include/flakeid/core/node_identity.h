#pragma once

#include "flakeid/core/errors.h"
#include "flakeid/core/result.h"

#include <compare>
#include <cstdint>
#include <string>

namespace flakeid::core {

class NodeIdentity;

// make_node_identity validates both ids against their 5-bit ranges.
// The datacenter id is checked first; the first failure is returned.
[[nodiscard]] Result<NodeIdentity, InvalidIdentity> make_node_identity(std::int64_t datacenter_id,
                                                                       std::int64_t worker_id);

// NodeIdentity is the validated (datacenter, worker) pair embedded in every Id a node
// issues. Instances only come from make_node_identity(), so both values are in range.
//
// Uniqueness of the pair across the fleet is the operator's responsibility; nothing
// here can detect two nodes sharing an identity.
class NodeIdentity {
 public:
  [[nodiscard]] std::uint32_t datacenter_id() const { return datacenter_id_; }
  [[nodiscard]] std::uint32_t worker_id() const { return worker_id_; }

  auto operator<=>(const NodeIdentity&) const = default;

 private:
  friend Result<NodeIdentity, InvalidIdentity> make_node_identity(std::int64_t datacenter_id,
                                                                  std::int64_t worker_id);

  NodeIdentity(std::uint32_t datacenter_id, std::uint32_t worker_id)
      : datacenter_id_(datacenter_id), worker_id_(worker_id) {}

  std::uint32_t datacenter_id_;
  std::uint32_t worker_id_;
};

// Format: "dc=<datacenter>/worker=<worker>"
[[nodiscard]] std::string to_string(const NodeIdentity& identity);

}  // namespace flakeid::core
