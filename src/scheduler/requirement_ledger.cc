#include "requirement_ledger.h"

#include <algorithm>
#include <cstdint>
#include <limits>

#include <glog/logging.h>

namespace Overlook {

int RequirementLedger::SetRequirement(const std::string& target, int delta) {
	if (delta == 0) {
		return RequiredCount(target);
	}

	auto it = required_.find(target);
	if (it == required_.end()) {
		if (delta < 0) {
			VLOG(1) << "No requirement for " << target << " to reduce, ignoring delta " << delta;
			return 0;
		}
		required_[target] = delta;
		TrackTarget(target);
		LOG(INFO) << "Now requiring " << delta << " instances for " << target;
		return delta;
	}

	// Saturates instead of wrapping on a huge scale-up
	int64_t sum = static_cast<int64_t>(it->second) + delta;
	int new_amount = sum > std::numeric_limits<int>::max()
		? std::numeric_limits<int>::max()
		: static_cast<int>(sum);
	if (new_amount <= 0) {
		required_.erase(it);
		ForgetTargetIfIdle(target);
		LOG(INFO) << "No more instances are required for " << target;
		return 0;
	}
	it->second = new_amount;
	LOG(INFO) << "Now requiring " << new_amount << " instances for " << target;
	return new_amount;
}

RequirementDeltas RequirementLedger::GetRequirementDeltas() const {
	RequirementDeltas deltas;
	deltas.reserve(target_order_.size());
	for (const auto& target : target_order_) {
		int running = 0;
		auto running_it = running_.find(target);
		if (running_it != running_.end()) {
			running = static_cast<int>(running_it->second.size());
		}
		deltas.emplace_back(target, RequiredCount(target) - running);
	}
	return deltas;
}

int RequirementLedger::RequiredCount(const std::string& target) const {
	auto it = required_.find(target);
	return it == required_.end() ? 0 : it->second;
}

void RequirementLedger::RegisterTask(const std::string& target, TaskHandle handle) {
	handle.target = target;
	task_targets_[handle.task_id] = target;
	LOG(INFO) << "Now running task " << handle.task_id << " for " << target
		<< " on port " << handle.port;
	running_[target].push_back(std::move(handle));
	TrackTarget(target);
}

bool RequirementLedger::UnregisterTask(const std::string& task_id) {
	auto owner = task_targets_.find(task_id);
	if (owner == task_targets_.end()) {
		return false;
	}
	const std::string target = owner->second;
	task_targets_.erase(owner);

	auto running_it = running_.find(target);
	if (running_it != running_.end()) {
		auto& tasks = running_it->second;
		tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
					[&task_id](const TaskHandle& h) { return h.task_id == task_id; }),
				tasks.end());
		if (tasks.empty()) {
			running_.erase(running_it);
		}
	}
	ForgetTargetIfIdle(target);
	LOG(INFO) << "Unregistered task " << task_id << " of " << target;
	return true;
}

std::optional<TaskHandle> RequirementLedger::YoungestTask(const std::string& target) const {
	auto it = running_.find(target);
	if (it == running_.end() || it->second.empty()) {
		return std::nullopt;
	}
	return it->second.back();
}

TaskHandle* RequirementLedger::FindTask(const std::string& task_id) {
	return const_cast<TaskHandle*>(static_cast<const RequirementLedger*>(this)->FindTask(task_id));
}

const TaskHandle* RequirementLedger::FindTask(const std::string& task_id) const {
	auto owner = task_targets_.find(task_id);
	if (owner == task_targets_.end()) {
		return nullptr;
	}
	auto running_it = running_.find(owner->second);
	if (running_it == running_.end()) {
		return nullptr;
	}
	for (const auto& handle : running_it->second) {
		if (handle.task_id == task_id) {
			return &handle;
		}
	}
	return nullptr;
}

std::vector<TaskHandle> RequirementLedger::RunningTasks(const std::string& target) const {
	auto it = running_.find(target);
	if (it == running_.end()) {
		return {};
	}
	return it->second;
}

std::vector<TaskHandle>* RequirementLedger::MutableRunningTasks(const std::string& target) {
	auto it = running_.find(target);
	if (it == running_.end()) {
		return nullptr;
	}
	return &it->second;
}

void RequirementLedger::TrackTarget(const std::string& target) {
	if (std::find(target_order_.begin(), target_order_.end(), target) == target_order_.end()) {
		target_order_.push_back(target);
	}
}

void RequirementLedger::ForgetTargetIfIdle(const std::string& target) {
	if (required_.contains(target) || running_.contains(target)) {
		return;
	}
	target_order_.erase(std::remove(target_order_.begin(), target_order_.end(), target),
			target_order_.end());
}

} // namespace Overlook
