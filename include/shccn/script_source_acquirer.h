#pragma once

#include <shccn/interfaces.h>
#include <shccn/logging.h>

#include <memory>

namespace shccn {

class ScriptSourceAcquirer : public SourceAcquirer {
public:
  explicit ScriptSourceAcquirer(std::shared_ptr<Logger> logger = nullptr);
  SourceAcquisitionResult Acquire(const AnalysisConfig &config) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace shccn
