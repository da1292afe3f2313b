#ifndef OVERLOOK_SRC_SCHEDULER_REQUIREMENT_LEDGER_H_
#define OVERLOOK_SRC_SCHEDULER_REQUIREMENT_LEDGER_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "task_handle.h"

namespace Overlook {

// Signed (required - running) per target, in ledger order
using RequirementDeltas = std::vector<std::pair<std::string, int>>;

/**
 * Desired instance count and running tasks per target.
 *
 * Targets are traversed in first-seen order: a target joins the order when it
 * gains a requirement or a running task, and leaves it once it has neither.
 * Not thread safe; FleetScheduler serializes access.
 */
class RequirementLedger {
	public:
		/**
		 * Adds delta to the target's required count. A result <= 0 removes the
		 * target's requirement. A non-positive delta for an absent target is a no-op.
		 *
		 * @return the resulting required count, 0 when no longer required
		 */
		int SetRequirement(const std::string& target, int delta);

		/**
		 * @return required minus running for every known target, in ledger order
		 */
		RequirementDeltas GetRequirementDeltas() const;

		int RequiredCount(const std::string& target) const;

		/**
		 * Appends a newly launched task to the target's running sequence
		 */
		void RegisterTask(const std::string& target, TaskHandle handle);

		/**
		 * Removes the task from whichever target runs it
		 *
		 * @return false if no task with that id was registered
		 */
		bool UnregisterTask(const std::string& task_id);

		/**
		 * @return the most recently launched task of the target, if any
		 */
		std::optional<TaskHandle> YoungestTask(const std::string& target) const;

		// nullptr if the id is not registered
		TaskHandle* FindTask(const std::string& task_id);
		const TaskHandle* FindTask(const std::string& task_id) const;

		// Oldest first; empty if the target runs nothing
		std::vector<TaskHandle> RunningTasks(const std::string& target) const;

		// Mutable running sequence for scale-down selection; nullptr if empty
		std::vector<TaskHandle>* MutableRunningTasks(const std::string& target);

		const std::vector<std::string>& Targets() const { return target_order_; }

		size_t NumRunningTasks() const { return task_targets_.size(); }

	private:
		void TrackTarget(const std::string& target);
		void ForgetTargetIfIdle(const std::string& target);

		absl::flat_hash_map<std::string, int> required_;
		absl::flat_hash_map<std::string, std::vector<TaskHandle>> running_;
		// task id -> owning target
		absl::flat_hash_map<std::string, std::string> task_targets_;
		std::vector<std::string> target_order_;
};

} // namespace Overlook

#endif // OVERLOOK_SRC_SCHEDULER_REQUIREMENT_LEDGER_H_
