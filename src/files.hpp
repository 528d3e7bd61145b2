// Simple file functions
#pragma once

#include <string>
#include <sys/stat.h>

inline bool file_exists(const std::string &name) {
  struct stat buffer;
  return (stat(name.c_str(), &buffer) == 0);
}

inline bool is_directory(const std::string &name) {
  struct stat buffer;
  return (stat(name.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

// Everything after the final '/', as python's os.path.basename
std::string base_name(const std::string &path);
// Everything before the final '/', empty if there is none
std::string dir_name(const std::string &path);
std::string join_path(const std::string &root, const std::string &name);

// mkdir -p; throws std::runtime_error if the path cannot be created
void make_path(const std::string &path);
// rm -r; silent if path does not exist
void remove_tree(const std::string &path);

// Private scratch directory, removed with everything in it when destroyed
class TempDir {
public:
  explicit TempDir(const std::string &prefix);
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::string &path() const { return _path; }

private:
  std::string _path;
};
