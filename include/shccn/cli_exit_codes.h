#pragma once

#include <shccn/models.h>

namespace shccn {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUsageError = 1;
inline constexpr int kExitUnreadableScripts = 2;

int AnalysisExitCode(const AnalysisResult &analysis);

} // namespace shccn
