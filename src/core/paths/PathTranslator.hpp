#pragma once
#include <string>
#include <vector>

// Converts between the operator's absolute paths (under the local mount of the
// records share) and the archive's file_server_directories form: forward slashes,
// relative to the mount, no leading slash.
class PathTranslator {
public:
  explicit PathTranslator(const std::string& mount);

  // Throws MalformedPath if the path is empty, relative or outside the mount.
  std::string toArchive(const std::string& operatorPath) const;

  std::string toOperator(const std::string& archiveDirectory,
                         const std::string& filename = "") const;

  bool isUnder(const std::string& operatorPath) const;

  const std::string& mount() const { return mount_; }

private:
  struct Split {
    std::string root;               // "C:", "\\\\server" or "/"; empty when relative
    std::vector<std::string> parts;
  };

  Split split(const std::string& path) const;
  bool sameSegment(const std::string& a, const std::string& b) const;

  std::string mount_;
  bool windows_;
  Split mountSplit_;
};
