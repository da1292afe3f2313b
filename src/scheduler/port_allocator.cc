#include "port_allocator.h"

#include <glog/logging.h>

#include "common/config.h"

namespace Overlook {

std::optional<uint32_t> PortAllocator::Allocate(const std::string& task_id,
		const orchestrator_protocol::Offer& offer) {
	auto existing = assigned_.find(task_id);
	if (existing != assigned_.end()) {
		LOG(WARNING) << "Task " << task_id << " already holds port " << existing->second;
		return existing->second;
	}

	for (const auto& resource : offer.resources()) {
		if (resource.name() != kPortsResource) continue;

		for (const auto& range : resource.ranges()) {
			for (uint64_t port = range.begin(); port < range.end(); port++) {
				if (port > UINT16_MAX) break;
				if (port == 0) continue;
				uint32_t candidate = static_cast<uint32_t>(port);
				if (!used_ports_.contains(candidate)) {
					assigned_[task_id] = candidate;
					used_ports_.insert(candidate);
					VLOG(2) << "Assigned port " << candidate << " to task " << task_id;
					return candidate;
				}
			}
		}
	}

	LOG(WARNING) << "Offer " << offer.id() << " had no unused port, task "
		<< task_id << " will not be launched";
	return std::nullopt;
}

void PortAllocator::Release(const std::string& task_id) {
	auto it = assigned_.find(task_id);
	if (it == assigned_.end()) {
		return;
	}
	VLOG(2) << "Released port " << it->second << " of task " << task_id;
	used_ports_.erase(it->second);
	assigned_.erase(it);
}

std::optional<uint32_t> PortAllocator::PortOf(const std::string& task_id) const {
	auto it = assigned_.find(task_id);
	if (it == assigned_.end()) {
		return std::nullopt;
	}
	return it->second;
}

} // namespace Overlook
