#ifndef PRINTBROKER_ENV_LOADER_H
#define PRINTBROKER_ENV_LOADER_H

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace env {
namespace detail {

inline std::string Trim(std::string_view value) {
  std::size_t start = 0;
  std::size_t end = value.size();
  while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return std::string(value.substr(start, end - start));
}

// Cuts a trailing "# comment" unless the hash sits inside quotes.
inline std::string StripInlineComment(const std::string &value) {
  char quote = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if ((ch == '"' || ch == '\'') && (quote == 0 || quote == ch)) {
      quote = quote == 0 ? ch : 0;
    } else if (ch == '#' && quote == 0) {
      return Trim(value.substr(0, i));
    }
  }
  return Trim(value);
}

inline std::string Unquote(std::string value) {
  if (value.size() >= 2) {
    const char first = value.front();
    if ((first == '"' || first == '\'') && value.back() == first) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

// KEY=value, optionally prefixed with "export ". Blank lines and comments
// yield nothing.
inline std::optional<std::pair<std::string, std::string>> ParseLine(const std::string &line) {
  const auto trimmed = Trim(line);
  if (trimmed.empty() || trimmed.front() == '#') {
    return std::nullopt;
  }
  const std::size_t equals = trimmed.find('=');
  if (equals == std::string::npos) {
    return std::nullopt;
  }
  std::string key = Trim(std::string_view(trimmed).substr(0, equals));
  if (key.rfind("export ", 0) == 0) {
    key = Trim(std::string_view(key).substr(7));
  }
  if (key.empty()) {
    return std::nullopt;
  }
  return std::make_pair(key, Unquote(StripInlineComment(trimmed.substr(equals + 1))));
}

inline bool LoadFile(const std::filesystem::path &path, bool override_existing) {
  std::ifstream stream(path);
  if (!stream.is_open()) {
    return false;
  }
  std::string line;
  while (std::getline(stream, line)) {
    const auto entry = ParseLine(line);
    if (!entry) {
      continue;
    }
    if (!override_existing && std::getenv(entry->first.c_str()) != nullptr) {
      continue;
    }
    setenv(entry->first.c_str(), entry->second.c_str(), 1);
  }
  return true;
}

inline std::optional<std::filesystem::path> FindBaseEnv(const std::filesystem::path &start) {
  namespace fs = std::filesystem;
  fs::path dir = start;
  for (int depth = 0; depth < 8; ++depth) {
    const fs::path candidate = dir / ".env";
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
    const fs::path parent = dir.parent_path();
    if (parent.empty() || parent == dir) {
      break;
    }
    dir = parent;
  }
  return std::nullopt;
}

}  // namespace detail

// Loads configuration files once per process and returns the files that were
// read. PRINTBROKER_ENV_FILE names a single file that overrides the
// environment; otherwise the nearest .env (walking up from start) fills unset
// variables and a sibling .env.local overrides them.
inline const std::vector<std::filesystem::path> &LoadEnvironment(
    std::filesystem::path start = std::filesystem::current_path()) {
  static std::once_flag once;
  static std::vector<std::filesystem::path> loaded;
  std::call_once(once, [start = std::move(start)]() {
    namespace fs = std::filesystem;
    if (const char *explicit_env = std::getenv("PRINTBROKER_ENV_FILE"); explicit_env && *explicit_env) {
      fs::path path(explicit_env);
      if (path.is_relative()) {
        path = start / path;
      }
      if (detail::LoadFile(path, true)) {
        loaded.push_back(path);
      }
      return;
    }
    const auto base_env = detail::FindBaseEnv(start);
    if (!base_env) {
      return;
    }
    if (detail::LoadFile(*base_env, false)) {
      loaded.push_back(*base_env);
    }
    fs::path local = *base_env;
    local += ".local";
    if (detail::LoadFile(local, true)) {
      loaded.push_back(local);
    }
  });
  return loaded;
}

}  // namespace env

#endif  // PRINTBROKER_ENV_LOADER_H
