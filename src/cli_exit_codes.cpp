#include <shccn/cli_exit_codes.h>

namespace shccn {

int AnalysisExitCode(const AnalysisResult &analysis) {
  if (!analysis.failures.empty()) {
    return kExitUnreadableScripts;
  }
  return kExitSuccess;
}

} // namespace shccn
