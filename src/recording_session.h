#ifndef RECORDING_SESSION_H

#define RECORDING_SESSION_H

#include <chrono>
#include <filesystem>
#include <vector>

#include "stream.h"
#include "stream_recorder.h"

static const size_t default_max_workers = 10;

struct recording_options {
	std::filesystem::path directory;
	std::chrono::steady_clock::duration duration {};
	size_t max_workers = default_max_workers;
};

size_t worker_count(size_t max_workers, size_t num_streams) noexcept;

// Records every stream concurrently, one task per stream, on a pool of at most
// options.max_workers threads. Returns once every recording has finished, or false if
// the output directory cannot be created. Failing recordings only affect themselves;
// on_outcome, if set, receives the outcome of each one.
bool record_streams(const std::vector<stream>& streams,
		    const recording_options& options,
		    const outcome_callback& on_outcome = {});

#endif // RECORDING_SESSION_H
