#include <shccn/script_source_acquirer.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

namespace shccn {

namespace {
constexpr const char kUnreadableDirectory[] = "cannot read directory";

bool HasScriptExtension(const std::filesystem::path &path,
                        const std::vector<std::string> &extensions) {
  const auto extension = path.extension().string();
  return std::find(extensions.begin(), extensions.end(), extension) !=
         extensions.end();
}

std::filesystem::path Normalize(const std::filesystem::path &path) {
  std::error_code error;
  auto normalized = std::filesystem::weakly_canonical(path, error);
  if (error) {
    return path.lexically_normal();
  }
  return normalized;
}

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &parent) {
  const auto normalized_candidate = Normalize(candidate);
  return std::distance(parent.begin(), parent.end()) <=
             std::distance(normalized_candidate.begin(),
                           normalized_candidate.end()) &&
         std::equal(parent.begin(), parent.end(), normalized_candidate.begin());
}

// Walks one input directory. Symlinked directories are not followed, and a
// directory that cannot be opened or listed is recorded and skipped.
class ScriptWalk {
public:
  ScriptWalk(const std::vector<std::string> &extensions,
             const std::vector<std::filesystem::path> &ignored_paths,
             Logger &logger)
      : extensions_(extensions), ignored_paths_(ignored_paths),
        logger_(logger) {}

  void Visit(const std::filesystem::path &directory) {
    std::error_code error;
    std::filesystem::directory_iterator it(directory, error);
    for (const std::filesystem::directory_iterator end{}; !error && it != end;
         it.increment(error)) {
      const auto &entry = *it;
      if (IsIgnored(entry.path())) {
        continue;
      }
      std::error_code status_error;
      if (!entry.is_symlink(status_error) &&
          entry.is_directory(status_error)) {
        Visit(entry.path());
        continue;
      }
      if (entry.is_regular_file(status_error) &&
          HasScriptExtension(entry.path(), extensions_)) {
        files_.push_back(entry.path().string());
      }
    }
    if (error) {
      logger_.Log(LogLevel::kWarn, "acquire.directory.unreadable",
                  {{"path", directory.string()}, {"error", error.message()}});
      failures_.push_back(
          ReadFailure{directory.string(), kUnreadableDirectory});
    }
  }

  std::vector<std::string> TakeFiles() {
    std::sort(files_.begin(), files_.end());
    return std::move(files_);
  }

  std::vector<ReadFailure> TakeFailures() { return std::move(failures_); }

private:
  bool IsIgnored(const std::filesystem::path &path) const {
    return std::any_of(
        ignored_paths_.begin(), ignored_paths_.end(),
        [&](const auto &ignored) { return IsWithin(path, ignored); });
  }

  const std::vector<std::string> &extensions_;
  const std::vector<std::filesystem::path> &ignored_paths_;
  Logger &logger_;
  std::vector<std::string> files_;
  std::vector<ReadFailure> failures_;
};
} // namespace

ScriptSourceAcquirer::ScriptSourceAcquirer(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

SourceAcquisitionResult
ScriptSourceAcquirer::Acquire(const AnalysisConfig &config) {
  if (config.inputs.empty()) {
    throw std::invalid_argument("At least one input path is required.");
  }

  std::vector<std::filesystem::path> ignored_paths;
  for (const auto &ignored : config.ignored_paths) {
    if (!ignored.empty()) {
      ignored_paths.push_back(Normalize(ignored));
    }
  }

  SourceAcquisitionResult result;
  std::unordered_set<std::string> seen;
  const auto add = [&](const std::string &file) {
    if (seen.insert(file).second) {
      result.files.push_back(file);
    }
  };

  for (const auto &input : config.inputs) {
    const std::filesystem::path path(input);
    std::error_code error;
    if (!std::filesystem::is_directory(path, error)) {
      // Missing files pass through so the loader reports them one by one.
      add(input);
      continue;
    }

    ScriptWalk walk(config.extensions, ignored_paths, *logger_);
    walk.Visit(path);
    const auto scripts = walk.TakeFiles();
    auto failures = walk.TakeFailures();
    logger_->Log(LogLevel::kDebug, "acquire.directory",
                 {{"path", input},
                  {"scripts", std::to_string(scripts.size())},
                  {"unreadable", std::to_string(failures.size())}});
    for (const auto &script : scripts) {
      add(script);
    }
    std::move(failures.begin(), failures.end(),
              std::back_inserter(result.failures));
  }

  logger_->Log(LogLevel::kInfo, "Collected scripts",
               {{"count", std::to_string(result.files.size())},
                {"unreadable", std::to_string(result.failures.size())}});
  return result;
}

} // namespace shccn
