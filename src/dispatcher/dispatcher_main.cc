#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "dispatcher/dispatcher_service.h"
#include "store/posix_chunk_store.h"
#include "store/retrying_chunk_store.h"

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("snapstream_dispatcher", "Coordinates distributed snapshot writers");

	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("p,port", "Port to serve the dispatcher on", cxxopts::value<int>())
		("lease_timeout_ms", "Worker lease timeout", cxxopts::value<int>())
		("max_chunk_size_bytes", "Default chunk size bound", cxxopts::value<size_t>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	Snapstream::Configuration& configuration = Snapstream::Configuration::getInstance();
	if (arguments.count("config") && !configuration.loadFromFile(arguments["config"].as<std::string>())) {
		LOG(ERROR) << "Failed to load " << arguments["config"].as<std::string>();
		return EXIT_FAILURE;
	}
	auto& config = configuration.config();
	if (arguments.count("port")) config.dispatcher.port.set(arguments["port"].as<int>());
	if (arguments.count("lease_timeout_ms")) {
		config.dispatcher.lease_timeout_ms.set(arguments["lease_timeout_ms"].as<int>());
	}
	if (arguments.count("max_chunk_size_bytes")) {
		config.snapshot.max_chunk_size_bytes.set(arguments["max_chunk_size_bytes"].as<size_t>());
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	auto store = std::make_shared<Snapstream::RetryingChunkStore>(
			std::make_shared<Snapstream::PosixChunkStore>(), Snapstream::RetryOptions::FromConfig());
	Snapstream::DispatcherServer server(store, Snapstream::DispatcherOptions::FromConfig());

	const std::string address = "0.0.0.0:" + std::to_string(configuration.getDispatcherPort());
	auto bound = server.Start(address);
	if (!bound.ok()) {
		LOG(ERROR) << "Failed to start dispatcher on " << address << ": " << bound.status();
		return EXIT_FAILURE;
	}
	LOG(INFO) << "Snapstream dispatcher listening on " << *bound;

	server.Wait();
	return EXIT_SUCCESS;
}
