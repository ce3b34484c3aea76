#pragma once

#include <gflags/gflags.h>

// 运行参数，定义见 flags.cpp
DECLARE_string(download_dir);
DECLARE_int32(reconcile_interval_ms);
DECLARE_int32(status_timeout_ms);
DECLARE_int32(connect_timeout_ms);
DECLARE_int32(low_speed_time_s);
DECLARE_string(custom_tbb_parallel_control);
DECLARE_string(log_dir);
DECLARE_string(log_level);
DECLARE_bool(log_to_console);
