#include "offer_matcher.h"

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include <glog/logging.h>

#include "common/config.h"
#include "common/configuration.h"

namespace Overlook {

namespace {

// Timestamp plus random suffix, so ids stay unique across scheduler restarts
std::string GenerateUniqueId() {
	auto now = std::chrono::system_clock::now();
	auto now_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
	long long timestamp = now_ms.time_since_epoch().count();

	std::random_device rd;
	std::mt19937 gen(rd());
	std::uniform_int_distribution<> dis(0, 999999);
	int random_num = dis(gen);

	std::stringstream ss;
	ss << std::hex << std::setfill('0')
		<< std::setw(12) << timestamp
		<< std::setw(6) << random_num;
	return ss.str();
}

orchestrator_protocol::Resource ScalarReservation(const char* name, double amount) {
	orchestrator_protocol::Resource resource;
	resource.set_name(name);
	resource.set_scalar(amount);
	return resource;
}

} // namespace

TaskTemplate TaskTemplate::FromConfig(const OverlookConfig& config) {
	TaskTemplate t;
	t.image = config.task.image.get();
	t.cpus = config.task.cpus.get();
	t.mem = config.task.mem.get();
	t.container_port = static_cast<uint32_t>(config.task.container_port.get());
	t.network = config.task.network.get() == "HOST"
		? orchestrator_protocol::ContainerInfo::HOST
		: orchestrator_protocol::ContainerInfo::BRIDGE;
	t.upstream_env = config.task.upstream_env.get();
	t.upstream_flag = config.task.upstream_flag.get();
	t.task_id_prefix = config.framework.task_id_prefix.get();
	return t;
}

double ScalarResource(const orchestrator_protocol::Offer& offer, const std::string& name) {
	double total = 0;
	for (const auto& resource : offer.resources()) {
		if (resource.name() == name) {
			total += resource.scalar();
		}
	}
	return total;
}

uint64_t PortCount(const orchestrator_protocol::Offer& offer) {
	uint64_t count = 0;
	for (const auto& resource : offer.resources()) {
		if (resource.name() != kPortsResource) continue;
		for (const auto& range : resource.ranges()) {
			if (range.end() > range.begin()) {
				count += range.end() - range.begin();
			}
		}
	}
	return count;
}

OfferMatcher::OfferMatcher(TaskTemplate task_template)
	: template_(std::move(task_template)), id_base_(GenerateUniqueId()) {}

std::optional<std::string> OfferMatcher::SelectTarget(const RequirementDeltas& deltas) {
	for (const auto& [target, delta] : deltas) {
		if (delta > 0) {
			return target;
		}
	}
	return std::nullopt;
}

bool OfferMatcher::HasSufficientResources(const orchestrator_protocol::Offer& offer) const {
	double cpus = ScalarResource(offer, kCpusResource);
	double mem = ScalarResource(offer, kMemResource);
	uint64_t ports = PortCount(offer);

	if (cpus < template_.cpus || mem < template_.mem || ports < kRequiredPortCount) {
		VLOG(1) << "Offer " << offer.id() << " on " << offer.hostname()
			<< " is insufficient: cpus=" << cpus << "/" << template_.cpus
			<< " mem=" << mem << "/" << template_.mem
			<< " ports=" << ports << "/" << kRequiredPortCount;
		return false;
	}
	return true;
}

orchestrator_protocol::TaskInfo OfferMatcher::BuildLaunchDescriptor(
		const orchestrator_protocol::Offer& offer,
		const std::string& task_id,
		const std::string& target,
		uint32_t port) const {
	orchestrator_protocol::TaskInfo task;
	task.set_task_id(task_id);
	task.set_name(template_.task_id_prefix + " for " + target);
	task.set_agent_id(offer.agent_id());

	*task.add_resources() = ScalarReservation(kCpusResource, template_.cpus);
	*task.add_resources() = ScalarReservation(kMemResource, template_.mem);
	orchestrator_protocol::Resource* ports = task.add_resources();
	ports->set_name(kPortsResource);
	orchestrator_protocol::Range* range = ports->add_ranges();
	range->set_begin(port);
	range->set_end(static_cast<uint64_t>(port) + kRequiredPortCount);

	orchestrator_protocol::ContainerInfo* container = task.mutable_container();
	container->set_image(template_.image);
	container->set_network(template_.network);

	orchestrator_protocol::CommandInfo* command = task.mutable_command();
	command->set_shell(false);
	command->add_arguments(template_.upstream_flag);
	command->add_arguments(target);

	if (template_.network == orchestrator_protocol::ContainerInfo::BRIDGE) {
		orchestrator_protocol::PortMapping* mapping = container->add_port_mappings();
		mapping->set_host_port(port);
		mapping->set_container_port(template_.container_port);
		mapping->set_protocol(kPortProtocol);
	} else {
		// Shared host network: the viewer itself must listen on the allocated port
		command->add_arguments(kListenPortFlag);
		command->add_arguments(std::to_string(port));
	}

	orchestrator_protocol::EnvironmentVariable* upstream = command->add_environment();
	upstream->set_name(template_.upstream_env);
	upstream->set_value(target);
	orchestrator_protocol::EnvironmentVariable* host_port = command->add_environment();
	host_port->set_name(kHostPortEnv);
	host_port->set_value(std::to_string(port));

	VLOG(2) << "Launch descriptor: " << task.ShortDebugString();
	return task;
}

std::string OfferMatcher::NextTaskId() {
	std::stringstream ss;
	ss << template_.task_id_prefix << "-" << id_base_ << "-" << next_sequence_++;
	return ss.str();
}

} // namespace Overlook
