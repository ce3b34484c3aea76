#include "flags.hpp"

DEFINE_string(download_dir, "downloads",
              "Directory that receives downloaded files");
DEFINE_int32(reconcile_interval_ms, 1000,
             "Interval between two worker status reconciliation passes");
DEFINE_int32(status_timeout_ms, 200,
             "How long a single worker status query may take before the "
             "worker is considered lost");
DEFINE_int32(connect_timeout_ms, 10000, "Transport connect timeout");
DEFINE_int32(low_speed_time_s, 30,
             "Abort a transfer that stays below 1 byte/s for this long");
DEFINE_string(custom_tbb_parallel_control, "",
              "TBB arena concurrency control, e.g. reconcile:4");
DEFINE_string(log_dir, "logs", "Directory for log files");
DEFINE_string(log_level, "INFO", "Minimum log level: DEBUG, INFO, WARN, ERROR");
DEFINE_bool(log_to_console, true, "Mirror log lines to stdout");
