#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "store/posix_chunk_store.h"
#include "store/retrying_chunk_store.h"
#include "worker/grpc_dispatcher_client.h"
#include "worker/snapshot_worker.h"

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("snapstream_worker", "Writes snapshot chunks for a dispatcher");

	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("d,dispatcher", "Dispatcher address (host:port)", cxxopts::value<std::string>())
		("worker_id", "Worker id; generated when empty", cxxopts::value<std::string>()->default_value(""))
		("heartbeat_interval_ms", "Heartbeat interval", cxxopts::value<int>())
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
	if (arguments.count("dispatcher")) {
		config.worker.dispatcher_address.set(arguments["dispatcher"].as<std::string>());
	}
	if (arguments.count("heartbeat_interval_ms")) {
		config.worker.heartbeat_interval_ms.set(arguments["heartbeat_interval_ms"].as<int>());
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	const std::string dispatcher_address = configuration.getDispatcherAddress();
	auto dispatcher = std::make_shared<Snapstream::GrpcDispatcherClient>(dispatcher_address);
	auto store = std::make_shared<Snapstream::RetryingChunkStore>(
			std::make_shared<Snapstream::PosixChunkStore>(), Snapstream::RetryOptions::FromConfig());

	Snapstream::WorkerOptions worker_options = Snapstream::WorkerOptions::FromConfig();
	worker_options.worker_id = arguments["worker_id"].as<std::string>();
	Snapstream::SnapshotWorker worker(dispatcher, store, worker_options);

	absl::Status started = worker.Start();
	if (!started.ok()) {
		LOG(ERROR) << "Worker could not reach dispatcher " << dispatcher_address << ": " << started;
		return EXIT_FAILURE;
	}
	LOG(INFO) << "Snapstream worker " << worker.worker_id() << " serving dispatcher " << dispatcher_address;

	worker.Wait();
	return EXIT_SUCCESS;
}
