#pragma once

#include <shccn/interfaces.h>

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace shccn {

class ScriptReadError : public std::runtime_error {
public:
  ScriptReadError(const std::string &path, const std::string &reason);

  const std::string &Path() const { return path_; }
  const std::string &Reason() const { return reason_; }

private:
  std::string path_;
  std::string reason_;
};

// One entry per physical line. A trailing carriage return is dropped and a
// final newline does not open an extra empty line.
std::vector<std::string> ReadLines(std::istream &stream);

class FileScriptLoader : public ScriptLoader {
public:
  SourceFile Load(const std::string &path) override;
};

} // namespace shccn
