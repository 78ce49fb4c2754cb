#pragma once
#include "DuplicateIndex.hpp"

#include <functional>
#include <string>
#include <vector>

// A named exclusion rule: returns true when the candidate must NOT be reviewed.
struct Filter {
  std::string name;
  std::function<bool(const FileInstance&)> excludes;
};

// Ordered list of filters; a candidate is dropped if any filter excludes it.
class FilterPipeline {
public:
  FilterPipeline() = default;
  explicit FilterPipeline(std::vector<Filter> filters) : filters_(std::move(filters)) {}

  // Built-in filters by name ("cad-support", "system-files"). Throws ConfigError
  // on an unknown name.
  static FilterPipeline fromNames(const std::vector<std::string>& names);

  bool excludes(const FileInstance& candidate) const;
  std::vector<FileInstance> apply(const std::vector<FileInstance>& candidates) const;

  const std::vector<Filter>& filters() const { return filters_; }

private:
  std::vector<Filter> filters_;
};

// CAD font, linetype and hatch support files, duplicated on purpose.
Filter excludeCadSupportFiles();

// thumbs.db, .DS_Store, desktop.ini.
Filter excludeSystemFiles();
