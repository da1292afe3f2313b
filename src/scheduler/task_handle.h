#ifndef OVERLOOK_SRC_SCHEDULER_TASK_HANDLE_H_
#define OVERLOOK_SRC_SCHEDULER_TASK_HANDLE_H_

#include <chrono>
#include <cstdint>
#include <string>

#include <orchestrator.pb.h>

namespace Overlook {

/**
 * Lifecycle of a launched viewer task.
 * Launching -> Running -> {Finished, Failed, Killed, Lost, Error}
 */
enum class TaskPhase {
	Launching,
	Running,
	Finished,
	Failed,
	Killed,
	Lost,
	Error
};

struct TaskHandle {
	std::string task_id;
	std::string target;
	uint32_t port = 0;
	TaskPhase phase = TaskPhase::Launching;
	// Set once a kill request has been sent, so the kill pass never repeats it
	bool kill_requested = false;
	std::string agent_id;
	std::string hostname;
	std::chrono::steady_clock::time_point launched_at;
};

bool IsTerminal(TaskPhase phase);

// Staging and starting both map to Launching
TaskPhase PhaseFromState(orchestrator_protocol::TaskState state);

const char* TaskPhaseName(TaskPhase phase);

} // namespace Overlook

#endif // OVERLOOK_SRC_SCHEDULER_TASK_HANDLE_H_
