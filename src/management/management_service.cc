#include "management_service.h"

#include <glog/logging.h>

#include "scheduler/fleet_scheduler.h"
#include "scheduler/task_handle.h"

namespace Overlook {

ManagementServiceImpl::ManagementServiceImpl(FleetScheduler* scheduler)
	: scheduler_(scheduler) {}

Status ManagementServiceImpl::ChangeRequirement(ServerContext* context,
		const RequirementChange* request, RequirementReply* reply) {
	if (request->target().empty()) {
		reply->set_success(false);
		reply->set_message("Target must not be empty");
		reply->set_required(0);
		return Status::OK;
	}

	VLOG(1) << "Requirement change for " << request->target() << " by " << request->delta();
	int required = scheduler_->ChangeRequirement(request->target(), request->delta());
	reply->set_success(true);
	reply->set_required(required);
	reply->set_message(required > 0
			? "Now requiring " + std::to_string(required) + " instances"
			: "No instances required");
	return Status::OK;
}

Status ManagementServiceImpl::GetFleet(ServerContext* context, const FleetQuery* request,
		FleetSnapshot* reply) {
	for (const auto& entry : scheduler_->Snapshot()) {
		management_system::TargetState* state = reply->add_targets();
		state->set_target(entry.target);
		state->set_required(entry.required);
		state->set_delta(entry.delta);
		for (const auto& task : entry.tasks) {
			management_system::TaskEntry* t = state->add_tasks();
			t->set_task_id(task.task_id);
			t->set_port(task.port);
			t->set_state(TaskPhaseName(task.phase));
			t->set_kill_requested(task.kill_requested);
		}
	}
	return Status::OK;
}

ManagementServer::ManagementServer(const std::string& address, FleetScheduler* scheduler)
	: address_(address),
	service_(std::make_unique<ManagementServiceImpl>(scheduler)) {}

ManagementServer::~ManagementServer() {
	Shutdown();
}

bool ManagementServer::Start() {
	ServerBuilder builder;
	builder.AddListeningPort(address_, grpc::InsecureServerCredentials(), &selected_port_);
	builder.RegisterService(service_.get());
	server_ = builder.BuildAndStart();
	if (!server_ || selected_port_ == 0) {
		LOG(ERROR) << "Failed to start management server on " << address_;
		server_.reset();
		return false;
	}
	LOG(INFO) << "Management server listening on " << address_;
	return true;
}

void ManagementServer::Wait() {
	if (server_) {
		server_->Wait();
	}
}

void ManagementServer::Shutdown() {
	if (server_) {
		server_->Shutdown();
		server_.reset();
		VLOG(3) << "\t[ManagementServer]\tShut down";
	}
}

} // namespace Overlook
