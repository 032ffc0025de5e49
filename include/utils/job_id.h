// job_id.h - random hex identifiers for jobs and containers
#pragma once

#include <string>

namespace mhub {

// Generate a random 16-hex-character job id.
std::string generate_job_id();

// Container name for a job: "mhub-<model>-<job id prefix>", restricted to
// characters the engines accept in names.
std::string generate_container_name(const std::string& model_id, const std::string& job_id);

}  // namespace mhub
