#include "orchestrator_client.h"

#include <chrono>
#include <vector>

#include <glog/logging.h>

#include "scheduler/fleet_scheduler.h"

namespace Overlook {

namespace {

constexpr int kCallTimeoutSeconds = 10;

} // namespace

OrchestratorClient::OrchestratorClient(
		const std::string& framework_name,
		const std::string& user,
		const std::shared_ptr<grpc::Channel>& channel,
		FleetScheduler* scheduler)
	: stub_(Orchestrator::NewStub(channel)),
	scheduler_(scheduler),
	framework_name_(framework_name),
	user_(user) {
	VLOG(3) << "\t[OrchestratorClient]\tConstructed";
}

OrchestratorClient::~OrchestratorClient() {
	Stop();
	VLOG(3) << "\t[OrchestratorClient]\tDestructed";
}

void OrchestratorClient::Start() {
	reply_thread_ = std::thread([this]() {
			this->ReplyLoop();
			});
	event_thread_ = std::thread([this]() {
			this->EventLoop();
			});
}

bool OrchestratorClient::Wait() {
	if (event_thread_.joinable()) {
		event_thread_.join();
	}
	return stream_ok_;
}

void OrchestratorClient::Stop() {
	shutdown_ = true;
	{
		absl::MutexLock lock(&subscribe_mutex_);
		if (subscribe_context_) {
			subscribe_context_->TryCancel();
		}
	}
	if (event_thread_.joinable()) {
		event_thread_.join();
	}

	{
		absl::MutexLock lock(&cq_mutex_);
		if (!cq_open_) {
			return;
		}
		cq_open_ = false;
		cq_.Shutdown();
	}
	if (reply_thread_.joinable()) {
		reply_thread_.join();
	}
}

std::string OrchestratorClient::GetFrameworkId() {
	absl::MutexLock lock(&framework_mutex_);
	return framework_id_;
}

//
// Subscription
//

void OrchestratorClient::EventLoop() {
	FrameworkInfo info;
	info.set_name(framework_name_);
	info.set_user(user_);
	info.set_framework_id(GetFrameworkId());

	grpc::ClientContext* context = nullptr;
	{
		absl::MutexLock lock(&subscribe_mutex_);
		if (shutdown_) {
			return;
		}
		subscribe_context_ = std::make_unique<grpc::ClientContext>();
		context = subscribe_context_.get();
	}

	LOG(INFO) << "Subscribing framework " << framework_name_ << " to the orchestrator";
	std::unique_ptr<grpc::ClientReader<Event>> reader(stub_->Subscribe(context, info));

	Event event;
	while (reader->Read(&event)) {
		Dispatch(event);
	}

	grpc::Status status = reader->Finish();
	if (shutdown_) {
		LOG(INFO) << "Subscription cancelled";
		stream_ok_ = true;
	} else if (status.ok()) {
		LOG(INFO) << "Orchestrator closed the subscription";
		stream_ok_ = true;
	} else {
		LOG(ERROR) << "Subscription failed: " << status.error_code() << " " << status.error_message();
		stream_ok_ = false;
	}
}

void OrchestratorClient::Dispatch(const Event& event) {
	switch (event.type()) {
		case Event::SUBSCRIBED:
			{
				absl::MutexLock lock(&framework_mutex_);
				framework_id_ = event.framework_id();
			}
			scheduler_->Registered(event.framework_id());
			break;
		case Event::OFFERS:
			scheduler_->ResourceOffers(std::vector<orchestrator_protocol::Offer>(
						event.offers().begin(), event.offers().end()));
			break;
		case Event::RESCIND:
			scheduler_->OfferRescinded(event.offer_id());
			break;
		case Event::UPDATE:
			scheduler_->StatusUpdate(event.status());
			break;
		case Event::AGENT_LOST:
			scheduler_->AgentLost(event.agent_id());
			break;
		case Event::ERROR:
			scheduler_->Error(event.message());
			break;
		default:
			LOG(WARNING) << "Ignoring event of unknown type " << static_cast<int>(event.type());
			break;
	}
}

//
// Outbound calls
//

void OrchestratorClient::LaunchTask(const std::string& offer_id,
		const orchestrator_protocol::TaskInfo& task) {
	orchestrator_protocol::AcceptRequest request;
	request.set_framework_id(GetFrameworkId());
	request.set_offer_id(offer_id);
	*request.add_tasks() = task;

	auto call = std::make_unique<AsyncClientCall>();
	call->description = "Accept of offer " + offer_id + " for task " + task.task_id();
	call->context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(kCallTimeoutSeconds));

	absl::MutexLock lock(&cq_mutex_);
	if (!cq_open_) {
		LOG(WARNING) << "Client stopped, dropping " << call->description;
		return;
	}
	call->response_reader = stub_->AsyncAccept(&call->context, request, &cq_);
	Track(std::move(call));
}

void OrchestratorClient::DeclineOffer(const std::string& offer_id) {
	orchestrator_protocol::DeclineRequest request;
	request.set_framework_id(GetFrameworkId());
	request.set_offer_id(offer_id);

	auto call = std::make_unique<AsyncClientCall>();
	call->description = "Decline of offer " + offer_id;
	call->context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(kCallTimeoutSeconds));

	absl::MutexLock lock(&cq_mutex_);
	if (!cq_open_) {
		LOG(WARNING) << "Client stopped, dropping " << call->description;
		return;
	}
	call->response_reader = stub_->AsyncDecline(&call->context, request, &cq_);
	Track(std::move(call));
}

void OrchestratorClient::KillTask(const std::string& task_id) {
	orchestrator_protocol::KillRequest request;
	request.set_framework_id(GetFrameworkId());
	request.set_task_id(task_id);

	auto call = std::make_unique<AsyncClientCall>();
	call->description = "Kill of task " + task_id;
	call->context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(kCallTimeoutSeconds));

	absl::MutexLock lock(&cq_mutex_);
	if (!cq_open_) {
		LOG(WARNING) << "Client stopped, dropping " << call->description;
		return;
	}
	call->response_reader = stub_->AsyncKill(&call->context, request, &cq_);
	Track(std::move(call));
}

// Ownership passes to the completion queue until ReplyLoop picks the tag up
void OrchestratorClient::Track(std::unique_ptr<AsyncClientCall> call) {
	AsyncClientCall* raw = call.release();
	raw->response_reader->Finish(&raw->reply, &raw->status, raw);
}

void OrchestratorClient::ReplyLoop() {
	void* got_tag;
	bool ok;

	while (cq_.Next(&got_tag, &ok)) {
		std::unique_ptr<AsyncClientCall> call(static_cast<AsyncClientCall*>(got_tag));
		if (!ok || !call->status.ok()) {
			LOG(ERROR) << call->description << " failed: " << call->status.error_message();
		} else if (!call->reply.accepted()) {
			LOG(WARNING) << call->description << " rejected: " << call->reply.message();
		} else {
			VLOG(2) << call->description << " acknowledged";
		}
	}
	VLOG(3) << "\t[OrchestratorClient]\tCompletion queue drained";
}

} // namespace Overlook
