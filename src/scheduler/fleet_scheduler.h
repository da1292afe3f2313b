#ifndef OVERLOOK_SRC_SCHEDULER_FLEET_SCHEDULER_H_
#define OVERLOOK_SRC_SCHEDULER_FLEET_SCHEDULER_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include <orchestrator.pb.h>

#include "offer_matcher.h"
#include "port_allocator.h"
#include "requirement_ledger.h"
#include "scheduler_driver.h"
#include "task_handle.h"

namespace Overlook {

/**
 * Point-in-time copy of one target's state, for the management endpoint
 */
struct TargetSnapshot {
	std::string target;
	int required = 0;
	int delta = 0;
	std::vector<TaskHandle> tasks;
};

/**
 * Keeps the viewer fleet matched to the required counts.
 *
 * Owns the requirement ledger and the port allocator behind one mutex, so an
 * offer batch, a status update and a requirement change each see and leave a
 * consistent state. Orchestrator callbacks arrive on the orchestrator client's
 * event thread; requirement changes arrive on management server threads.
 * Driver calls are made with the mutex held and must not block.
 */
class FleetScheduler {
	public:
		explicit FleetScheduler(TaskTemplate task_template, ISchedulerDriver* driver = nullptr);
		~FleetScheduler();

		void SetDriver(ISchedulerDriver* driver);

		//
		// Orchestrator callbacks
		//

		void Registered(const std::string& framework_id);

		/**
		 * Matches each offer, in order, against the outstanding requirement.
		 * Launches at most one viewer per offer and declines every offer not used.
		 * Without an attached driver offers are dropped and nothing is registered.
		 */
		void ResourceOffers(const std::vector<orchestrator_protocol::Offer>& offers);

		void OfferRescinded(const std::string& offer_id);

		/**
		 * Applies a task state transition. Terminal states free the task's port and
		 * remove it from the ledger. Unknown task ids are ignored.
		 */
		void StatusUpdate(const orchestrator_protocol::TaskStatus& status);

		void AgentLost(const std::string& agent_id);

		void Error(const std::string& message);

		//
		// Management boundary
		//

		/**
		 * Adds delta to the target's required count and kills any resulting excess,
		 * youngest task first.
		 *
		 * @return the resulting required count
		 */
		int ChangeRequirement(const std::string& target, int delta);

		//
		// Read-only views
		//

		std::vector<TargetSnapshot> Snapshot() const;
		RequirementDeltas GetRequirementDeltas() const;
		int RequiredCount(const std::string& target) const;
		std::vector<TaskHandle> RunningTasks(const std::string& target) const;
		std::optional<TaskHandle> YoungestTask(const std::string& target) const;
		std::optional<uint32_t> PortOf(const std::string& task_id) const;

	private:
		// Launches on the offer or declines it
		void MatchOffer(const orchestrator_protocol::Offer& offer)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

		// Sends kills, youngest first, until every negative delta is covered
		void KillExcess() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

		void Decline(const orchestrator_protocol::Offer& offer, const char* reason)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

		mutable absl::Mutex mutex_;
		RequirementLedger ledger_ ABSL_GUARDED_BY(mutex_);
		PortAllocator ports_ ABSL_GUARDED_BY(mutex_);
		OfferMatcher matcher_ ABSL_GUARDED_BY(mutex_);
		ISchedulerDriver* driver_ ABSL_GUARDED_BY(mutex_);
		std::string framework_id_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Overlook

#endif // OVERLOOK_SRC_SCHEDULER_FLEET_SCHEDULER_H_
