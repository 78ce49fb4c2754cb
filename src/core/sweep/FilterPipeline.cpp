#include "FilterPipeline.hpp"
#include "core/errors/Errors.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Filter excludeCadSupportFiles() {
  return {"cad-support", [](const FileInstance& f) {
    static const std::array<const char*, 4> exts{".shx", ".lin", ".pat", ".pcx"};
    const std::string name = lower(f.filename);
    return std::any_of(exts.begin(), exts.end(),
                       [&](const char* ext) { return endsWith(name, ext); });
  }};
}

Filter excludeSystemFiles() {
  return {"system-files", [](const FileInstance& f) {
    const std::string name = lower(f.filename);
    return name == "thumbs.db" || name == ".ds_store" || name == "desktop.ini";
  }};
}

FilterPipeline FilterPipeline::fromNames(const std::vector<std::string>& names) {
  std::vector<Filter> filters;
  for (const auto& n : names) {
    if (n == "cad-support") filters.push_back(excludeCadSupportFiles());
    else if (n == "system-files") filters.push_back(excludeSystemFiles());
    else throw ConfigError("unknown filter '" + n + "' (known: cad-support, system-files)");
  }
  return FilterPipeline(std::move(filters));
}

bool FilterPipeline::excludes(const FileInstance& candidate) const {
  return std::any_of(filters_.begin(), filters_.end(),
                     [&](const Filter& f) { return f.excludes(candidate); });
}

std::vector<FileInstance> FilterPipeline::apply(const std::vector<FileInstance>& candidates) const {
  std::vector<FileInstance> kept;
  kept.reserve(candidates.size());
  for (const auto& c : candidates) {
    auto hit = std::find_if(filters_.begin(), filters_.end(),
                            [&](const Filter& f) { return f.excludes(c); });
    if (hit != filters_.end()) {
      spdlog::debug("Filter '{}' excluded {}/{} (file {})", hit->name, c.directory, c.filename, c.file_id);
      continue;
    }
    kept.push_back(c);
  }
  return kept;
}
