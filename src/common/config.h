#pragma once

#include <cstddef>
#include <cstdint>

/// Dispatcher defaults
/// Port the dispatcher gRPC service listens on
const int kDefaultDispatcherPort = 5050;
/// A worker silent for this long loses the splits it holds
const int64_t kDefaultLeaseTimeoutMs = 10000;
/// Interval between two lease scans
const int64_t kDefaultLeaseCheckIntervalMs = 1000;
/// Longest a GetSplit call blocks before answering WAIT
const int64_t kDefaultSplitWaitMs = 1000;

/// Worker defaults
const int64_t kDefaultWorkerHeartbeatIntervalMs = 1000;
/// Deadline added to the split wait for GetSplit RPCs
const int64_t kDefaultRpcTimeoutMs = 5000;

/// Snapshot defaults
const size_t kDefaultMaxChunkSizeBytes = 16UL << 20;

/// Reader defaults (tailing backoff)
const int64_t kDefaultPollInitialBackoffMs = 10;
const int64_t kDefaultPollMaxBackoffMs = 1000;

/// Store retry defaults
const int kDefaultStoreRetryMaxAttempts = 5;
const int64_t kDefaultStoreRetryInitialBackoffMs = 20;
const int64_t kDefaultStoreRetryMaxBackoffMs = 2000;

/// Dynamic sharding queue depth
const size_t kDefaultShardQueueCapacity = 1024;
