#include "util/flags.hpp"

DEFINE_int32(max_iterations, 5,
             "Default maximum number of generate/repair iterations (1-10)");
DEFINE_bool(emit_cost_updates, false,
            "Emit a cost_update event after every gateway-backed step");

DEFINE_int32(execution_timeout_millis, 5000,
             "Wall-clock limit for a single execution of a candidate");
DEFINE_int32(kill_grace_millis, 500,
             "Time between SIGTERM and SIGKILL when stopping a guest");
DEFINE_string(interpreter, "/usr/bin/python3",
              "Interpreter for the candidate programs. A bare name is "
              "looked up in PATH");
DEFINE_string(temp_directory, "/tmp/codeforge",
              "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false, "Do not remove the sandbox directories");
DEFINE_int32(memory_limit_kb, 1048576,
             "Address space limit of the guest, 0 for unlimited");
DEFINE_int32(max_output_kb, 8192,
             "Maximum size of any file written by the guest, including its "
             "captured output");
DEFINE_int32(max_files, 64, "Maximum number of open files of the guest");
DEFINE_bool(require_network_isolation, false,
            "Fail executions when a private network namespace is not "
            "available");

DEFINE_string(gateway_address, "127.0.0.1:7072",
              "Address of the generation gateway");
DEFINE_int32(gateway_deadline_seconds, 120,
             "Deadline of a single generation gateway call");

DEFINE_string(session_directory, "sessions",
              "Where the file session store keeps its documents");
DEFINE_int32(port, 7071, "Port the server listens on");
