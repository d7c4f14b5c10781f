#pragma once

// UUID7DER Utilities - output sinks and argument parsing for tools
//
// Separate from the core library so consumers that only encode do not pull in
// POSIX file descriptor handling.

#include "utils/der_output.hpp"
#include "utils/output_status.hpp"
#include "utils/parse_number.hpp"
