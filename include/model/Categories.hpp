#pragma once

// Category names tie records produced by a collector to the rule list that
// judges them.
namespace vigil::model::category {

inline constexpr const char* kBackupJob = "backup_job";

inline constexpr const char* kDisk     = "disk";
inline constexpr const char* kCpu      = "cpu";
inline constexpr const char* kMemory   = "memory";
inline constexpr const char* kServices = "services";
inline constexpr const char* kReboot   = "reboot";
inline constexpr const char* kDefender = "defender";

// Perf counters use their normalized counter path as category.
inline constexpr const char* kPerfCpu        = "\\processor(_total)\\% processor time";
inline constexpr const char* kPerfCommitted  = "\\memory\\% committed bytes in use";
inline constexpr const char* kPerfAvailable  = "\\memory\\available mbytes";
inline constexpr const char* kPerfDiskQueue  = "\\physicaldisk(_total)\\avg. disk queue length";

} // namespace vigil::model::category
