#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Snapstream {

// Global function to get configuration instance
const Configuration& GetConfig() {
	return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
	const char* env_val = std::getenv(env_var_.c_str());
	if (env_val) {
		try {
			return std::stoi(env_val);
		} catch (const std::exception& e) {
			LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
		}
	}
	return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
	const char* env_val = std::getenv(env_var_.c_str());
	if (env_val) {
		try {
			return std::stoull(env_val);
		} catch (const std::exception& e) {
			LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
		}
	}
	return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
	const char* env_val = std::getenv(env_var_.c_str());
	if (env_val) {
		return std::string(env_val);
	}
	return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
	const char* env_val = std::getenv(env_var_.c_str());
	if (env_val) {
		std::string val(env_val);
		std::transform(val.begin(), val.end(), val.begin(), ::tolower);
		if (val == "true" || val == "1" || val == "yes" || val == "on") {
			return true;
		} else if (val == "false" || val == "0" || val == "no" || val == "off") {
			return false;
		}
		LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
	}
	return std::nullopt;
}

Configuration& Configuration::getInstance() {
	static Configuration instance;
	return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
	if (!yaml["snapstream"]) {
		LOG(WARNING) << "Configuration has no 'snapstream' root; keeping defaults";
		return;
	}
	auto root = yaml["snapstream"];

	// Dispatcher
	if (root["dispatcher"]) {
		auto dispatcher = root["dispatcher"];
		if (dispatcher["port"]) config_.dispatcher.port.set(dispatcher["port"].as<int>());
		if (dispatcher["lease_timeout_ms"]) config_.dispatcher.lease_timeout_ms.set(dispatcher["lease_timeout_ms"].as<int>());
		if (dispatcher["lease_check_interval_ms"]) config_.dispatcher.lease_check_interval_ms.set(dispatcher["lease_check_interval_ms"].as<int>());
		if (dispatcher["split_wait_ms"]) config_.dispatcher.split_wait_ms.set(dispatcher["split_wait_ms"].as<int>());
	}

	// Worker
	if (root["worker"]) {
		auto worker = root["worker"];
		if (worker["dispatcher_address"]) config_.worker.dispatcher_address.set(worker["dispatcher_address"].as<std::string>());
		if (worker["heartbeat_interval_ms"]) config_.worker.heartbeat_interval_ms.set(worker["heartbeat_interval_ms"].as<int>());
		if (worker["rpc_timeout_ms"]) config_.worker.rpc_timeout_ms.set(worker["rpc_timeout_ms"].as<int>());
	}

	// Snapshot
	if (root["snapshot"]) {
		auto snapshot = root["snapshot"];
		if (snapshot["max_chunk_size_bytes"]) config_.snapshot.max_chunk_size_bytes.set(snapshot["max_chunk_size_bytes"].as<size_t>());
		if (snapshot["compression"]) config_.snapshot.compression.set(snapshot["compression"].as<std::string>());
	}

	// Reader
	if (root["reader"]) {
		auto reader = root["reader"];
		if (reader["poll_initial_backoff_ms"]) config_.reader.poll_initial_backoff_ms.set(reader["poll_initial_backoff_ms"].as<int>());
		if (reader["poll_max_backoff_ms"]) config_.reader.poll_max_backoff_ms.set(reader["poll_max_backoff_ms"].as<int>());
		if (reader["shard_queue_capacity"]) config_.reader.shard_queue_capacity.set(reader["shard_queue_capacity"].as<size_t>());
	}

	// Store
	if (root["store"]) {
		auto store = root["store"];
		if (store["retry_max_attempts"]) config_.store.retry_max_attempts.set(store["retry_max_attempts"].as<int>());
		if (store["retry_initial_backoff_ms"]) config_.store.retry_initial_backoff_ms.set(store["retry_initial_backoff_ms"].as<int>());
		if (store["retry_max_backoff_ms"]) config_.store.retry_max_backoff_ms.set(store["retry_max_backoff_ms"].as<int>());
	}
}

bool Configuration::loadFromFile(const std::string& filename) {
	try {
		YAML::Node yaml = YAML::LoadFile(filename);
		applyYAML(yaml);
		return validateConfig();
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
		return false;
	}
}

bool Configuration::loadFromString(const std::string& yaml_content) {
	try {
		YAML::Node yaml = YAML::Load(yaml_content);
		applyYAML(yaml);
		return validateConfig();
	} catch (const YAML::Exception& e) {
		LOG(ERROR) << "Failed to parse configuration string: " << e.what();
		return false;
	}
}

bool Configuration::validate() const {
	validation_errors_.clear();

	if (config_.dispatcher.port.get() < 0 || config_.dispatcher.port.get() > 65535) {
		validation_errors_.push_back("Dispatcher port must be between 0 and 65535");
	}

	if (config_.dispatcher.lease_timeout_ms.get() <= config_.dispatcher.lease_check_interval_ms.get()) {
		validation_errors_.push_back("Lease timeout must exceed the lease check interval");
	}

	if (config_.dispatcher.split_wait_ms.get() < 1) {
		validation_errors_.push_back("Split wait must be at least 1ms");
	}

	if (config_.worker.heartbeat_interval_ms.get() >= config_.dispatcher.lease_timeout_ms.get()) {
		validation_errors_.push_back("Worker heartbeat interval must be shorter than the lease timeout");
	}

	if (config_.worker.rpc_timeout_ms.get() <= config_.dispatcher.split_wait_ms.get()) {
		validation_errors_.push_back("RPC timeout must exceed the split wait");
	}

	if (config_.snapshot.max_chunk_size_bytes.get() < 1) {
		validation_errors_.push_back("Max chunk size must be at least 1 byte");
	}

	const std::string compression = config_.snapshot.compression.get();
	if (compression != "none" && compression != "auto" &&
			compression != "blosc_lz4" && compression != "blosc_zstd") {
		validation_errors_.push_back("Unknown compression '" + compression + "'");
	}

	if (config_.reader.poll_initial_backoff_ms.get() < 1 ||
			config_.reader.poll_max_backoff_ms.get() < config_.reader.poll_initial_backoff_ms.get()) {
		validation_errors_.push_back("Poll backoff must satisfy 1 <= initial <= max");
	}

	if (config_.reader.shard_queue_capacity.get() < 1) {
		validation_errors_.push_back("Shard queue capacity must be at least 1");
	}

	if (config_.store.retry_max_attempts.get() < 1) {
		validation_errors_.push_back("Store retry attempts must be at least 1");
	}

	if (config_.store.retry_initial_backoff_ms.get() < 0 ||
			config_.store.retry_max_backoff_ms.get() < config_.store.retry_initial_backoff_ms.get()) {
		validation_errors_.push_back("Store retry backoff must satisfy 0 <= initial <= max");
	}

	return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
	return validation_errors_;
}

bool Configuration::validateConfig() {
	bool valid = validate();
	for (const auto& error : validation_errors_) {
		LOG(ERROR) << "Invalid configuration: " << error;
	}
	return valid;
}

} // namespace Snapstream
