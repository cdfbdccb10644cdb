#include "flakeid/core/node_identity.h"

#include "flakeid/core/layout.h"

namespace flakeid::core {

Result<NodeIdentity, InvalidIdentity> make_node_identity(std::int64_t datacenter_id,
                                                         std::int64_t worker_id) {
  using R = Result<NodeIdentity, InvalidIdentity>;

  if (datacenter_id < 0 || datacenter_id > kMaxDatacenterId) {
    return R::err(InvalidIdentity{IdentityField::kDatacenterId, datacenter_id});
  }
  if (worker_id < 0 || worker_id > kMaxWorkerId) {
    return R::err(InvalidIdentity{IdentityField::kWorkerId, worker_id});
  }

  return R::ok(
      NodeIdentity(static_cast<std::uint32_t>(datacenter_id), static_cast<std::uint32_t>(worker_id)));
}

std::string to_string(const NodeIdentity& identity) {
  return "dc=" + std::to_string(identity.datacenter_id()) +
         "/worker=" + std::to_string(identity.worker_id());
}

}  // namespace flakeid::core
