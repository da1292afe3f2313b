#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <cxxopts.hpp>
#include <grpcpp/grpcpp.h>
#include "absl/strings/str_split.h"

#include "common/configuration.h"
#include "management/management_service.h"
#include "orchestrator/orchestrator_client.h"
#include "scheduler/fleet_scheduler.h"
#include "scheduler/offer_matcher.h"

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("overlookd", "Keeps a fleet of viewer instances running on a resource-offer cluster");

	options.add_options()
		("o,orchestrator", "Orchestrator address and port", cxxopts::value<std::string>())
		("zk", "Same as --orchestrator", cxxopts::value<std::string>())
		("es", "Targets to require once each, separated by ';'", cxxopts::value<std::string>())
		("p,api_port", "Management port", cxxopts::value<int>())
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("i,image", "Viewer container image", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	std::unique_ptr<cxxopts::ParseResult> parsed;
	try {
		parsed = std::make_unique<cxxopts::ParseResult>(options.parse(argc, argv));
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		std::cerr << options.help() << std::endl;
		return EXIT_FAILURE;
	}
	const cxxopts::ParseResult& arguments = *parsed;

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Overlook::Configuration& configuration = Overlook::Configuration::getInstance();
	if (arguments.count("config")) {
		if (!configuration.loadFromFile(arguments["config"].as<std::string>())) {
			return EXIT_FAILURE;
		}
	}

	Overlook::OverlookConfig& config = configuration.config();
	if (arguments.count("orchestrator")) {
		config.framework.orchestrator_address.set(arguments["orchestrator"].as<std::string>());
	} else if (arguments.count("zk")) {
		config.framework.orchestrator_address.set(arguments["zk"].as<std::string>());
	}
	if (arguments.count("api_port")) {
		config.management.port.set(arguments["api_port"].as<int>());
	}
	if (arguments.count("image")) {
		config.task.image.set(arguments["image"].as<std::string>());
	}
	if (arguments.count("es")) {
		for (absl::string_view target :
				absl::StrSplit(arguments["es"].as<std::string>(), ';', absl::SkipWhitespace())) {
			config.targets.initial.emplace_back(target);
		}
	}

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}

	// *************** Initialize scheduler **********************
	Overlook::FleetScheduler scheduler(Overlook::TaskTemplate::FromConfig(config));
	for (const auto& target : configuration.getInitialTargets()) {
		scheduler.ChangeRequirement(target, 1);
	}

	Overlook::OrchestratorClient client(config.framework.name.get(), config.framework.user.get(),
			grpc::CreateChannel(configuration.getOrchestratorAddress(), grpc::InsecureChannelCredentials()),
			&scheduler);
	scheduler.SetDriver(&client);

	Overlook::ManagementServer management(configuration.getManagementAddress(), &scheduler);
	if (!management.Start()) {
		scheduler.SetDriver(nullptr);
		return EXIT_FAILURE;
	}

	client.Start();
	LOG(INFO) << "Overlook subscribed to " << configuration.getOrchestratorAddress()
		<< ", management on " << configuration.getManagementAddress();

	// *************** Wait until the subscription ends **********************
	bool clean = client.Wait();

	management.Shutdown();
	scheduler.SetDriver(nullptr);
	client.Stop();

	LOG(INFO) << "Overlook Terminating";
	return clean ? EXIT_SUCCESS : EXIT_FAILURE;
}
