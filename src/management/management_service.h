#ifndef OVERLOOK_SRC_MANAGEMENT_MANAGEMENT_SERVICE_H_
#define OVERLOOK_SRC_MANAGEMENT_MANAGEMENT_SERVICE_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <management.grpc.pb.h>

namespace Overlook {

class FleetScheduler;

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using management_system::FleetManagement;
using management_system::RequirementChange;
using management_system::RequirementReply;
using management_system::FleetQuery;
using management_system::FleetSnapshot;

class ManagementServiceImpl final : public FleetManagement::Service {
	public:
		explicit ManagementServiceImpl(FleetScheduler* scheduler);

		// A request without target is refused in the reply, not with a status code
		Status ChangeRequirement(ServerContext* context, const RequirementChange* request,
				RequirementReply* reply) override;

		Status GetFleet(ServerContext* context, const FleetQuery* request,
				FleetSnapshot* reply) override;

	private:
		FleetScheduler* scheduler_;
};

/**
 * Serves the FleetManagement service on the configured address
 */
class ManagementServer {
	public:
		ManagementServer(const std::string& address, FleetScheduler* scheduler);
		~ManagementServer();

		/**
		 * @return false if the server could not bind
		 */
		bool Start();
		void Wait();
		void Shutdown();

	private:
		std::string address_;
		std::unique_ptr<ManagementServiceImpl> service_;
		std::unique_ptr<Server> server_;
		int selected_port_ = 0;
};

} // namespace Overlook

#endif // OVERLOOK_SRC_MANAGEMENT_MANAGEMENT_SERVICE_H_
