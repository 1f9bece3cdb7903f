#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Run loop
DECLARE_int32(max_iterations);
DECLARE_bool(emit_cost_updates);

// Sandbox
DECLARE_int32(execution_timeout_millis);
DECLARE_int32(kill_grace_millis);
DECLARE_string(interpreter);
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);
DECLARE_int32(memory_limit_kb);
DECLARE_int32(max_output_kb);
DECLARE_int32(max_files);
DECLARE_bool(require_network_isolation);

// Generation gateway
DECLARE_string(gateway_address);
DECLARE_int32(gateway_deadline_seconds);

// Sessions and server
DECLARE_string(session_directory);
DECLARE_int32(port);

#endif
