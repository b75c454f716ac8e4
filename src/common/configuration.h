#ifndef SNAPSTREAM_CONFIGURATION_H_
#define SNAPSTREAM_CONFIGURATION_H_

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"

namespace YAML {
class Node;
}

namespace Snapstream {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
	ConfigValue() = default;
	ConfigValue(T default_value, const std::string& env_var = "")
		: value_(default_value), env_var_(env_var) {}

	T get() const {
		if (!env_var_.empty()) {
			auto env_value = getEnvValue();
			if (env_value.has_value()) {
				return env_value.value();
			}
		}
		return value_;
	}

	void set(T value) { value_ = value; }
	const std::string& env_var() const { return env_var_; }

private:
	T value_;
	std::string env_var_;

	std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct SnapstreamConfig {
	struct Dispatcher {
		ConfigValue<int> port{kDefaultDispatcherPort, "SNAPSTREAM_DISPATCHER_PORT"};
		ConfigValue<int> lease_timeout_ms{static_cast<int>(kDefaultLeaseTimeoutMs), "SNAPSTREAM_LEASE_TIMEOUT_MS"};
		ConfigValue<int> lease_check_interval_ms{static_cast<int>(kDefaultLeaseCheckIntervalMs), "SNAPSTREAM_LEASE_CHECK_INTERVAL_MS"};
		ConfigValue<int> split_wait_ms{static_cast<int>(kDefaultSplitWaitMs), "SNAPSTREAM_SPLIT_WAIT_MS"};
	} dispatcher;

	struct Worker {
		ConfigValue<std::string> dispatcher_address{"127.0.0.1:" + std::to_string(kDefaultDispatcherPort), "SNAPSTREAM_DISPATCHER_ADDRESS"};
		ConfigValue<int> heartbeat_interval_ms{static_cast<int>(kDefaultWorkerHeartbeatIntervalMs), "SNAPSTREAM_WORKER_HEARTBEAT_MS"};
		ConfigValue<int> rpc_timeout_ms{static_cast<int>(kDefaultRpcTimeoutMs), "SNAPSTREAM_RPC_TIMEOUT_MS"};
	} worker;

	struct Snapshot {
		ConfigValue<size_t> max_chunk_size_bytes{kDefaultMaxChunkSizeBytes, "SNAPSTREAM_MAX_CHUNK_SIZE_BYTES"};
		// none | auto | blosc_lz4 | blosc_zstd
		ConfigValue<std::string> compression{"none", "SNAPSTREAM_COMPRESSION"};
	} snapshot;

	struct Reader {
		ConfigValue<int> poll_initial_backoff_ms{static_cast<int>(kDefaultPollInitialBackoffMs), "SNAPSTREAM_POLL_INITIAL_BACKOFF_MS"};
		ConfigValue<int> poll_max_backoff_ms{static_cast<int>(kDefaultPollMaxBackoffMs), "SNAPSTREAM_POLL_MAX_BACKOFF_MS"};
		ConfigValue<size_t> shard_queue_capacity{kDefaultShardQueueCapacity, "SNAPSTREAM_SHARD_QUEUE_CAPACITY"};
	} reader;

	struct Store {
		ConfigValue<int> retry_max_attempts{kDefaultStoreRetryMaxAttempts, "SNAPSTREAM_STORE_RETRY_MAX_ATTEMPTS"};
		ConfigValue<int> retry_initial_backoff_ms{static_cast<int>(kDefaultStoreRetryInitialBackoffMs), "SNAPSTREAM_STORE_RETRY_INITIAL_BACKOFF_MS"};
		ConfigValue<int> retry_max_backoff_ms{static_cast<int>(kDefaultStoreRetryMaxBackoffMs), "SNAPSTREAM_STORE_RETRY_MAX_BACKOFF_MS"};
	} store;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
	static Configuration& getInstance();

	// Load configuration from file
	bool loadFromFile(const std::string& filename);

	// Load configuration from YAML string
	bool loadFromString(const std::string& yaml_content);

	// Get the configuration
	const SnapstreamConfig& config() const { return config_; }
	SnapstreamConfig& config() { return config_; }

	// Helper methods for common access patterns
	int getDispatcherPort() const { return config_.dispatcher.port.get(); }
	std::string getDispatcherAddress() const { return config_.worker.dispatcher_address.get(); }
	size_t getMaxChunkSizeBytes() const { return config_.snapshot.max_chunk_size_bytes.get(); }

	// Validation
	bool validate() const;
	std::vector<std::string> getValidationErrors() const;

	// Restores every value to its compiled-in default.
	void reset() { config_ = SnapstreamConfig(); }

private:
	Configuration() = default;
	Configuration(const Configuration&) = delete;
	Configuration& operator=(const Configuration&) = delete;

	SnapstreamConfig config_;
	mutable std::vector<std::string> validation_errors_;

	void applyYAML(const YAML::Node& yaml);
	bool validateConfig();
};

// Global accessor used by option builders across modules
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Snapstream

#endif // SNAPSTREAM_CONFIGURATION_H_
