#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <memory>
#include <sstream>

#include "glog/logging.h"

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

// Set when a pass of OsMakeTreeWritable met a directory it could not read.
thread_local bool unreadable_dir_found = false;

// Gives the owner full access to every directory of the tree, so that their
// entries can be listed and removed. Directories that could not be read are
// listed only by the next pass, after being made readable by this one.
bool OsMakeTreeWritable(const std::string& path) {
  const int max_passes = 64;
  for (int pass = 0; pass < max_passes; pass++) {
    unreadable_dir_found = false;
    int ret = nftw(path.c_str(),
                   [](const char* fpath, const struct stat* sb, int typeflags,
                      struct FTW* ftwbuf) {
                     if (typeflags == FTW_DNR) unreadable_dir_found = true;
                     if (typeflags == FTW_D || typeflags == FTW_DNR) {
                       chmod(fpath, S_IRWXU);
                     }
                     return 0;
                   },
                   64, FTW_PHYS | FTW_MOUNT);
    if (ret == -1) return false;
    if (!unreadable_dir_found) return true;
  }
  return true;
}

bool OsRemoveTree(const std::string& path) {
  if (!OsMakeTreeWritable(path)) return false;
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path, const std::string& prefix) {
  std::string tmp = util::File::JoinPath(path, prefix + "XXXXXX");
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp.c_str()), &free};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents,
            bool overwrite) {
  int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (overwrite ? O_TRUNC : O_EXCL);
  int fd = open(path.c_str(), flags, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written =
        write(fd, contents.c_str() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      return error;
    }
    pos += written;
  }
  return close(fd) == -1 ? errno : 0;
}

}  // namespace

namespace util {

std::vector<std::string> File::ListDir(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  }
  std::vector<std::string> entries;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    entries.push_back(std::move(name));
  }
  closedir(dir);
  return entries;
}

std::string File::Read(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  int err = OsWrite(path, contents, overwrite);
  if (err == EEXIST) throw file_exists("Write " + path);
  if (err) throw std::system_error(err, std::system_category(), "Write " + path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

void File::MakeWorldWritable(const std::string& path) {
  if (chmod(path.c_str(), S_IRWXU | S_IRWXG | S_IRWXO) == -1)
    throw std::system_error(errno, std::system_category(), "chmod " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return path.substr(0, 1);
  return path.substr(0, pos);
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

bool File::Exists(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0;
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  path_ = OsTempDir(base, prefix);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || moved_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Unable to remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
