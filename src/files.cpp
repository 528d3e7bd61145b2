/*
 *
 * files.cpp
 * Path helpers and scratch directories
 *
 */

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <dirent.h>
#include <unistd.h>

#include "files.hpp"

std::string base_name(const std::string &path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) {
    return path;
  }
  return path.substr(slash + 1);
}

std::string dir_name(const std::string &path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) {
    return "";
  } else if (slash == 0) {
    return "/";
  }
  return path.substr(0, slash);
}

std::string join_path(const std::string &root, const std::string &name) {
  if (root.empty()) {
    return name;
  } else if (root.back() == '/') {
    return root + name;
  }
  return root + "/" + name;
}

void make_path(const std::string &path) {
  if (path.empty() || is_directory(path)) {
    return;
  }
  make_path(dir_name(path));
  if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
    throw std::runtime_error("Could not create directory " + path + ": " +
                             std::strerror(errno));
  }
  if (!is_directory(path)) {
    throw std::runtime_error(path + " exists and is not a directory");
  }
}

void remove_tree(const std::string &path) {
  struct stat buffer;
  if (lstat(path.c_str(), &buffer) != 0) {
    return;
  }
  if (S_ISDIR(buffer.st_mode)) {
    std::vector<std::string> entries;
    DIR *dir = opendir(path.c_str());
    if (dir != nullptr) {
      struct dirent *entry;
      while ((entry = readdir(dir)) != nullptr) {
        const std::string name(entry->d_name);
        if (name != "." && name != "..") {
          entries.push_back(join_path(path, name));
        }
      }
      closedir(dir);
    }
    for (auto entry_it = entries.cbegin(); entry_it != entries.cend();
         ++entry_it) {
      remove_tree(*entry_it);
    }
    rmdir(path.c_str());
  } else {
    unlink(path.c_str());
  }
}

TempDir::TempDir(const std::string &prefix) {
  const char *tmp_root = std::getenv("TMPDIR");
  std::string pattern =
      join_path(tmp_root != nullptr && *tmp_root != '\0' ? tmp_root : "/tmp",
                prefix + "XXXXXX");
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr) {
    throw std::runtime_error("Could not create temporary directory " +
                             pattern + ": " + std::strerror(errno));
  }
  _path = buffer.data();
}

TempDir::~TempDir() { remove_tree(_path); }
