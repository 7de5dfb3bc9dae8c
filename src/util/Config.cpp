#include "conduit/util/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>

namespace conduit {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

static std::uint32_t toU32(const std::string& v, std::uint32_t fallback) {
  char* end = nullptr;
  unsigned long long n = std::strtoull(v.c_str(), &end, 10);
  if (end == v.c_str() || *end != '\0' || v[0] == '-') return fallback;
  return n > 0xFFFFFFFFull ? 0xFFFFFFFFu : (std::uint32_t)n;
}

static bool toBool(const std::string& v) {
  std::string x = v; for (auto& c : x) c = (char)std::tolower((unsigned char)c);
  return x == "1" || x == "true" || x == "yes" || x == "on";
}

void Config::applyLine(const std::string& raw) {
  // Strip CR/LF
  std::string line = raw;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

  auto s = trim(line);
  if (s.empty()) return;
  if (s[0] == '#' || s[0] == ';') return; // comment

  std::string key, val;
  if (!parseLineKV(s, key, val)) return;

  if      (key == "workers")       workers       = std::max<std::uint32_t>(1, toU32(val, workers));
  else if (key == "seed")          seed          = toU32(val, seed);
  else if (key == "stopAt")        stopAt        = toU32(val, stopAt);
  else if (key == "joinTimeoutMs") joinTimeoutMs = std::max<std::uint32_t>(1, toU32(val, joinTimeoutMs));
  else if (key == "logLevel")      logLevel      = val;
  else if (key == "logFormat")     logFormat     = (val == "json") ? "json" : "text";
  else if (key == "logFile")       logFile       = val;
  else if (key == "report")        report        = toBool(val);
  else {
    // Unknown key; ignore to stay forward-compatible
  }
}

void Config::loadFromString(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) applyLine(line);
}

bool Config::loadFromFile(const std::string& path) {
  // Simple INI-ish parser: key=value per line, '#' or ';' start comments.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  char tmp[1024];
  while (std::fgets(tmp, sizeof(tmp), f)) {
    line.append(tmp);
    // Long lines arrive in pieces; only apply once the newline is seen.
    if (!line.empty() && line.back() != '\n' && !std::feof(f)) continue;
    applyLine(line);
    line.clear();
  }
  if (!line.empty()) applyLine(line);

  std::fclose(f);
  return true;
}

} // namespace util
} // namespace conduit
