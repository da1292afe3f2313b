#ifndef OVERLOOK_SRC_ORCHESTRATOR_ORCHESTRATOR_CLIENT_H_
#define OVERLOOK_SRC_ORCHESTRATOR_ORCHESTRATOR_CLIENT_H_

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "absl/synchronization/mutex.h"
#include <grpcpp/grpcpp.h>
#include <orchestrator.grpc.pb.h>

#include "scheduler/scheduler_driver.h"

namespace Overlook {

class FleetScheduler;

using orchestrator_protocol::Orchestrator;
using orchestrator_protocol::CallResponse;
using orchestrator_protocol::Event;
using orchestrator_protocol::FrameworkInfo;

/**
 * Subscribes to the orchestrator and relays its events to the FleetScheduler,
 * while serving as the scheduler's driver for outbound calls.
 *
 * Events are read on a dedicated thread. Launch, decline and kill calls are
 * issued asynchronously on a completion queue, whose replies are drained by a
 * second thread, so no caller ever waits on the network.
 */
class OrchestratorClient : public ISchedulerDriver {
	public:
		OrchestratorClient(const std::string& framework_name,
				const std::string& user,
				const std::shared_ptr<grpc::Channel>& channel,
				FleetScheduler* scheduler);

		~OrchestratorClient() override;

		// Opens the subscription and starts both threads
		void Start();

		/**
		 * Blocks until the subscription stream ends
		 *
		 * @return true if the stream closed cleanly
		 */
		bool Wait();

		// Cancels the subscription and drains outstanding calls
		void Stop();

		void LaunchTask(const std::string& offer_id,
				const orchestrator_protocol::TaskInfo& task) override;
		void DeclineOffer(const std::string& offer_id) override;
		void KillTask(const std::string& task_id) override;

		std::string GetFrameworkId();

	private:
		struct AsyncClientCall {
			CallResponse reply;
			grpc::ClientContext context;
			grpc::Status status;
			std::string description;
			std::unique_ptr<grpc::ClientAsyncResponseReader<CallResponse>> response_reader;
		};

		void EventLoop();
		void Dispatch(const Event& event);
		void ReplyLoop();
		void Track(std::unique_ptr<AsyncClientCall> call);

		std::unique_ptr<Orchestrator::Stub> stub_;
		FleetScheduler* scheduler_;
		std::string framework_name_;
		std::string user_;

		absl::Mutex framework_mutex_;
		std::string framework_id_ ABSL_GUARDED_BY(framework_mutex_);

		absl::Mutex subscribe_mutex_;
		std::unique_ptr<grpc::ClientContext> subscribe_context_ ABSL_GUARDED_BY(subscribe_mutex_);

		// Calls may only start while the queue is open
		absl::Mutex cq_mutex_;
		bool cq_open_ ABSL_GUARDED_BY(cq_mutex_) = true;
		grpc::CompletionQueue cq_;

		std::thread event_thread_;
		std::thread reply_thread_;
		std::atomic<bool> shutdown_{false};
		std::atomic<bool> stream_ok_{false};
};

} // namespace Overlook

#endif // OVERLOOK_SRC_ORCHESTRATOR_ORCHESTRATOR_CLIENT_H_
