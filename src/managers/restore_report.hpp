#pragma once

#include <ostream>
#include <store/job_store.hpp>

// Print every Request that is not finished, with its Downloads and their
// attempt counts.
void print_restore_report(JobStore& store, std::ostream& out);
