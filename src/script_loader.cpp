#include <shccn/script_loader.h>

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace shccn {

ScriptReadError::ScriptReadError(const std::string &path,
                                 const std::string &reason)
    : std::runtime_error("Failed to read script " + path + ": " + reason),
      path_(path), reason_(reason) {}

std::vector<std::string> ReadLines(std::istream &stream) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

SourceFile FileScriptLoader::Load(const std::string &path) {
  const std::filesystem::path script(path);
  std::error_code error;
  if (!std::filesystem::exists(script, error)) {
    throw ScriptReadError(path, "no such file");
  }
  if (std::filesystem::is_directory(script, error)) {
    throw ScriptReadError(path, "is a directory");
  }

  std::ifstream stream(script);
  if (!stream) {
    throw ScriptReadError(path, "cannot open file");
  }
  auto lines = ReadLines(stream);
  if (stream.bad()) {
    throw ScriptReadError(path, "read error");
  }
  return SourceFile(script.filename().string(), std::move(lines));
}

} // namespace shccn
