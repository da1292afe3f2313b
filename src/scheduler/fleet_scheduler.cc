#include "fleet_scheduler.h"

#include <chrono>
#include <utility>

#include <glog/logging.h>

namespace Overlook {

FleetScheduler::FleetScheduler(TaskTemplate task_template, ISchedulerDriver* driver)
	: matcher_(std::move(task_template)), driver_(driver) {
	VLOG(3) << "\t[FleetScheduler]\tConstructed";
}

FleetScheduler::~FleetScheduler() {
	VLOG(3) << "\t[FleetScheduler]\tDestructed";
}

void FleetScheduler::SetDriver(ISchedulerDriver* driver) {
	absl::MutexLock lock(&mutex_);
	driver_ = driver;
}

void FleetScheduler::Registered(const std::string& framework_id) {
	absl::MutexLock lock(&mutex_);
	framework_id_ = framework_id;
	LOG(INFO) << "Framework registered with id " << framework_id;
}

void FleetScheduler::ResourceOffers(const std::vector<orchestrator_protocol::Offer>& offers) {
	absl::MutexLock lock(&mutex_);
	VLOG(1) << "Received " << offers.size() << " offers";

	KillExcess();
	for (const auto& offer : offers) {
		MatchOffer(offer);
	}
}

void FleetScheduler::MatchOffer(const orchestrator_protocol::Offer& offer) {
	std::optional<std::string> target = OfferMatcher::SelectTarget(ledger_.GetRequirementDeltas());
	if (!target.has_value()) {
		Decline(offer, "no instances required");
		return;
	}

	if (!matcher_.HasSufficientResources(offer)) {
		Decline(offer, "insufficient resources");
		return;
	}

	std::string task_id = matcher_.NextTaskId();
	std::optional<uint32_t> port = ports_.Allocate(task_id, offer);
	if (!port.has_value()) {
		Decline(offer, "no free port");
		return;
	}

	if (driver_ == nullptr) {
		LOG(ERROR) << "No orchestrator driver attached, dropping offer " << offer.id()
			<< " without launching or declining it";
		ports_.Release(task_id);
		return;
	}

	LOG(INFO) << "Launching task " << task_id << " for " << *target
		<< " on " << offer.hostname() << ":" << *port;
	driver_->LaunchTask(offer.id(),
			matcher_.BuildLaunchDescriptor(offer, task_id, *target, *port));

	TaskHandle handle;
	handle.task_id = task_id;
	handle.port = *port;
	handle.phase = TaskPhase::Launching;
	handle.agent_id = offer.agent_id();
	handle.hostname = offer.hostname();
	handle.launched_at = std::chrono::steady_clock::now();
	ledger_.RegisterTask(*target, std::move(handle));
}

void FleetScheduler::Decline(const orchestrator_protocol::Offer& offer, const char* reason) {
	VLOG(1) << "Declining offer " << offer.id() << " from " << offer.hostname() << ": " << reason;
	if (driver_ == nullptr) {
		LOG(ERROR) << "No orchestrator driver attached, cannot decline offer " << offer.id();
		return;
	}
	driver_->DeclineOffer(offer.id());
}

void FleetScheduler::KillExcess() {
	for (const auto& [target, delta] : ledger_.GetRequirementDeltas()) {
		if (delta >= 0) continue;

		std::vector<TaskHandle>* tasks = ledger_.MutableRunningTasks(target);
		if (tasks == nullptr) continue;

		int pending = 0;
		for (const auto& task : *tasks) {
			if (task.kill_requested) pending++;
		}
		int excess = -delta - pending;

		// Youngest first
		for (auto it = tasks->rbegin(); it != tasks->rend() && excess > 0; ++it) {
			if (it->kill_requested) continue;
			if (driver_ == nullptr) {
				LOG(ERROR) << "No orchestrator driver attached, cannot kill task " << it->task_id;
				return;
			}
			LOG(INFO) << "Killing task " << it->task_id << " of " << target
				<< " (" << TaskPhaseName(it->phase) << ")";
			it->kill_requested = true;
			driver_->KillTask(it->task_id);
			excess--;
		}
	}
}

void FleetScheduler::OfferRescinded(const std::string& offer_id) {
	LOG(INFO) << "Offer " << offer_id << " rescinded";
}

void FleetScheduler::StatusUpdate(const orchestrator_protocol::TaskStatus& status) {
	absl::MutexLock lock(&mutex_);
	VLOG(1) << "Status update: " << status.ShortDebugString();

	TaskHandle* handle = ledger_.FindTask(status.task_id());
	if (handle == nullptr) {
		LOG(INFO) << "Ignoring " << orchestrator_protocol::TaskState_Name(status.state())
			<< " for unknown task " << status.task_id();
		return;
	}

	TaskPhase phase = PhaseFromState(status.state());
	if (IsTerminal(phase)) {
		LOG(INFO) << "Task " << status.task_id() << " of " << handle->target << " is "
			<< TaskPhaseName(phase)
			<< (status.message().empty() ? "" : ": " + status.message());
		ports_.Release(status.task_id());
		ledger_.UnregisterTask(status.task_id());
		return;
	}

	if (phase == TaskPhase::Running && handle->phase != TaskPhase::Running) {
		handle->phase = TaskPhase::Running;
		LOG(INFO) << "Task " << status.task_id() << " of " << handle->target
			<< " is running on " << handle->hostname << ":" << handle->port;
	}
}

void FleetScheduler::AgentLost(const std::string& agent_id) {
	// Tasks on the agent are reconciled by their own TASK_LOST updates
	LOG(WARNING) << "Agent " << agent_id << " lost";
}

void FleetScheduler::Error(const std::string& message) {
	LOG(ERROR) << "Orchestrator error: " << message;
}

int FleetScheduler::ChangeRequirement(const std::string& target, int delta) {
	absl::MutexLock lock(&mutex_);
	if (delta == 0) {
		return ledger_.RequiredCount(target);
	}
	int required = ledger_.SetRequirement(target, delta);
	KillExcess();
	return required;
}

std::vector<TargetSnapshot> FleetScheduler::Snapshot() const {
	absl::MutexLock lock(&mutex_);
	std::vector<TargetSnapshot> snapshot;
	for (const auto& [target, delta] : ledger_.GetRequirementDeltas()) {
		TargetSnapshot entry;
		entry.target = target;
		entry.required = ledger_.RequiredCount(target);
		entry.delta = delta;
		entry.tasks = ledger_.RunningTasks(target);
		snapshot.push_back(std::move(entry));
	}
	return snapshot;
}

RequirementDeltas FleetScheduler::GetRequirementDeltas() const {
	absl::MutexLock lock(&mutex_);
	return ledger_.GetRequirementDeltas();
}

int FleetScheduler::RequiredCount(const std::string& target) const {
	absl::MutexLock lock(&mutex_);
	return ledger_.RequiredCount(target);
}

std::vector<TaskHandle> FleetScheduler::RunningTasks(const std::string& target) const {
	absl::MutexLock lock(&mutex_);
	return ledger_.RunningTasks(target);
}

std::optional<TaskHandle> FleetScheduler::YoungestTask(const std::string& target) const {
	absl::MutexLock lock(&mutex_);
	return ledger_.YoungestTask(target);
}

std::optional<uint32_t> FleetScheduler::PortOf(const std::string& task_id) const {
	absl::MutexLock lock(&mutex_);
	return ports_.PortOf(task_id);
}

} // namespace Overlook
