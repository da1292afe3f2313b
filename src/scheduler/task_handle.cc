#include "task_handle.h"

#include <glog/logging.h>

namespace Overlook {

bool IsTerminal(TaskPhase phase) {
	switch (phase) {
		case TaskPhase::Launching:
		case TaskPhase::Running:
			return false;
		case TaskPhase::Finished:
		case TaskPhase::Failed:
		case TaskPhase::Killed:
		case TaskPhase::Lost:
		case TaskPhase::Error:
			return true;
	}
	return false;
}

TaskPhase PhaseFromState(orchestrator_protocol::TaskState state) {
	switch (state) {
		case orchestrator_protocol::TASK_STAGING:
		case orchestrator_protocol::TASK_STARTING:
			return TaskPhase::Launching;
		case orchestrator_protocol::TASK_RUNNING:
			return TaskPhase::Running;
		case orchestrator_protocol::TASK_FINISHED:
			return TaskPhase::Finished;
		case orchestrator_protocol::TASK_FAILED:
			return TaskPhase::Failed;
		case orchestrator_protocol::TASK_KILLED:
			return TaskPhase::Killed;
		case orchestrator_protocol::TASK_LOST:
			return TaskPhase::Lost;
		case orchestrator_protocol::TASK_ERROR:
			return TaskPhase::Error;
		default:
			break;
	}
	// Launching is never applied over an existing phase, so unknown states are no-ops
	LOG(WARNING) << "Unknown task state " << static_cast<int>(state) << ", ignoring";
	return TaskPhase::Launching;
}

const char* TaskPhaseName(TaskPhase phase) {
	switch (phase) {
		case TaskPhase::Launching: return "LAUNCHING";
		case TaskPhase::Running: return "RUNNING";
		case TaskPhase::Finished: return "FINISHED";
		case TaskPhase::Failed: return "FAILED";
		case TaskPhase::Killed: return "KILLED";
		case TaskPhase::Lost: return "LOST";
		case TaskPhase::Error: return "ERROR";
	}
	return "UNKNOWN";
}

} // namespace Overlook
