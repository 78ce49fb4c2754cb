#include "PathTranslator.hpp"
#include "core/errors/Errors.hpp"

#include <cctype>

static bool isDriveSpec(const std::string& p) {
  return p.size() >= 2 && std::isalpha(static_cast<unsigned char>(p[0])) && p[1] == ':';
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

PathTranslator::PathTranslator(const std::string& mount)
  : mount_(mount),
    windows_(mount.find('\\') != std::string::npos || isDriveSpec(mount)) {
  mountSplit_ = split(mount_);
  if (mountSplit_.root.empty()) {
    throw MalformedPath("file server mount must be an absolute path: '" + mount + "'");
  }
}

PathTranslator::Split PathTranslator::split(const std::string& path) const {
  auto isSep = [this](char c) { return c == '/' || (windows_ && c == '\\'); };

  Split out;
  size_t pos = 0;
  if (windows_ && path.size() >= 2 && isSep(path[0]) && isSep(path[1])) {
    // UNC: \\server\share\... ; the server name belongs to the root
    pos = 2;
    size_t end = pos;
    while (end < path.size() && !isSep(path[end])) ++end;
    out.root = "\\\\" + path.substr(pos, end - pos);
    pos = end;
  } else if (windows_ && isDriveSpec(path)) {
    if (path.size() > 2 && !isSep(path[2])) return out; // "C:foo" is drive-relative
    out.root = std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(path[0])))) + ":";
    pos = 2;
  } else if (!path.empty() && isSep(path[0])) {
    out.root = windows_ ? "\\" : "/";
  } else {
    return out;
  }

  std::string seg;
  auto flush = [&]() {
    if (seg.empty() || seg == ".") {
      // nothing
    } else if (seg == "..") {
      if (!out.parts.empty()) out.parts.pop_back();
    } else {
      out.parts.push_back(seg);
    }
    seg.clear();
  };
  for (; pos < path.size(); ++pos) {
    if (isSep(path[pos])) flush();
    else seg.push_back(path[pos]);
  }
  flush();
  return out;
}

bool PathTranslator::sameSegment(const std::string& a, const std::string& b) const {
  return windows_ ? lower(a) == lower(b) : a == b;
}

std::string PathTranslator::toArchive(const std::string& operatorPath) const {
  if (operatorPath.empty()) throw MalformedPath("empty path");

  const Split s = split(operatorPath);
  if (s.root.empty()) throw MalformedPath("path is not absolute: '" + operatorPath + "'");

  const auto& base = mountSplit_.parts;
  bool under = sameSegment(s.root, mountSplit_.root) && s.parts.size() >= base.size();
  for (size_t i = 0; under && i < base.size(); ++i) {
    under = sameSegment(s.parts[i], base[i]);
  }
  if (!under) {
    throw MalformedPath("'" + operatorPath + "' is not under '" + mount_ + "'");
  }

  std::string rel;
  for (size_t i = base.size(); i < s.parts.size(); ++i) {
    if (!rel.empty()) rel += '/';
    rel += s.parts[i];
  }
  return rel;
}

std::string PathTranslator::toOperator(const std::string& archiveDirectory,
                                       const std::string& filename) const {
  const char sep = windows_ ? '\\' : '/';
  const auto& root = mountSplit_.root;

  std::string out = root;
  bool needSep = (root != "/" && root != "\\");
  auto append = [&](const std::string& seg) {
    if (seg.empty()) return;
    if (needSep) out += sep;
    out += seg;
    needSep = true;
  };

  for (const auto& p : mountSplit_.parts) append(p);

  std::string seg;
  for (char c : archiveDirectory) {
    if (c == '/') { append(seg); seg.clear(); }
    else seg.push_back(c);
  }
  append(seg);
  append(filename);
  return out;
}

bool PathTranslator::isUnder(const std::string& operatorPath) const {
  try {
    toArchive(operatorPath);
    return true;
  } catch (const MalformedPath&) {
    return false;
  }
}
