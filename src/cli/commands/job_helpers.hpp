#pragma once

#include "../base_cli.hpp"
#include <string>

// Shared helpers used by job command files (jobs.cpp, pdf.cpp, serve.cpp)

// Full job id for an exact id or a unique id prefix. Prints and returns ""
// when nothing or more than one job matches.
std::string resolve_job_id(BaseCLI& cli, const std::string& arg);

// Status name colored for listings.
std::string status_label(JobStatus status);
std::string status_label(RunStatus status);

// One-line summary printed by serve and the job actions.
std::string job_line(const Job& job);

// Parses a positive integer argument; prints usage and returns false otherwise.
bool parse_int_arg(BaseCLI& cli, const std::string& arg, int& out, const std::string& usage);
