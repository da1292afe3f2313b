#ifndef OVERLOOK_SRC_SCHEDULER_OFFER_MATCHER_H_
#define OVERLOOK_SRC_SCHEDULER_OFFER_MATCHER_H_

#include <cstdint>
#include <optional>
#include <string>

#include <orchestrator.pb.h>
#include "requirement_ledger.h"

namespace Overlook {

struct OverlookConfig;

/**
 * Fixed per-instance launch template, read once at startup
 */
struct TaskTemplate {
	std::string image = "kibana";
	double cpus = 0.1;
	double mem = 128.0;
	uint32_t container_port = 5601;
	orchestrator_protocol::ContainerInfo::Network network =
		orchestrator_protocol::ContainerInfo::BRIDGE;
	std::string upstream_env = "ELASTICSEARCH_URL";
	std::string upstream_flag = "--elasticsearch_url";
	std::string task_id_prefix = "viewer";

	static TaskTemplate FromConfig(const OverlookConfig& config);
};

/// Sum of the named scalar resource across the offer
double ScalarResource(const orchestrator_protocol::Offer& offer, const std::string& name);

/// Number of ports across all "ports" ranges of the offer, each range [begin, end)
uint64_t PortCount(const orchestrator_protocol::Offer& offer);

/**
 * Per-offer decision helpers: which target to serve, whether the offer fits one
 * viewer, and the launch descriptor for it. Holds no ledger state.
 */
class OfferMatcher {
	public:
		explicit OfferMatcher(TaskTemplate task_template);

		/**
		 * @return the first target in ledger order with a positive delta
		 */
		static std::optional<std::string> SelectTarget(const RequirementDeltas& deltas);

		/**
		 * @return true if the offer covers cpus, mem and the port count of one viewer
		 */
		bool HasSufficientResources(const orchestrator_protocol::Offer& offer) const;

		/**
		 * Builds the task to launch on the offer's agent: container, port mapping,
		 * command and environment pointing the viewer at the target, and the
		 * resource reservation.
		 */
		orchestrator_protocol::TaskInfo BuildLaunchDescriptor(
				const orchestrator_protocol::Offer& offer,
				const std::string& task_id,
				const std::string& target,
				uint32_t port) const;

		// Unique across this process
		std::string NextTaskId();

		const TaskTemplate& task_template() const { return template_; }

	private:
		TaskTemplate template_;
		std::string id_base_;
		uint64_t next_sequence_ = 0;
};

} // namespace Overlook

#endif // OVERLOOK_SRC_SCHEDULER_OFFER_MATCHER_H_
