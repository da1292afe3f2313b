#ifndef OVERLOOK_SRC_SCHEDULER_PORT_ALLOCATOR_H_
#define OVERLOOK_SRC_SCHEDULER_PORT_ALLOCATOR_H_

#include <cstdint>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include <orchestrator.pb.h>

namespace Overlook {

/**
 * Host port bookkeeping for viewers sharing a host's network.
 * No two live tasks hold the same port, whichever agent they run on.
 * Not thread safe; FleetScheduler serializes access.
 */
class PortAllocator {
	public:
		/**
		 * Picks the first unassigned port from the offer's port ranges, scanned in
		 * the order presented, each range as [begin, end).
		 *
		 * @param task_id Task to record the port against
		 * @param offer Offer whose "ports" resources are scanned
		 * @return the port, or nullopt if the offer holds no free port
		 */
		std::optional<uint32_t> Allocate(const std::string& task_id,
				const orchestrator_protocol::Offer& offer);

		// Idempotent
		void Release(const std::string& task_id);

		std::optional<uint32_t> PortOf(const std::string& task_id) const;
		bool InUse(uint32_t port) const { return used_ports_.contains(port); }
		size_t size() const { return assigned_.size(); }

	private:
		absl::flat_hash_map<std::string, uint32_t> assigned_;
		absl::flat_hash_set<uint32_t> used_ports_;
};

} // namespace Overlook

#endif // OVERLOOK_SRC_SCHEDULER_PORT_ALLOCATOR_H_
