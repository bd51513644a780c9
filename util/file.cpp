#include "util/file.hpp"

#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <memory>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

// Sandbox directories may have been made read-only.
bool OsMakeTreeWritable(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) {
                if (typeflags == FTW_D) chmod(fpath, S_IRWXU);
                return 0;
              },
              64, FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path, std::string* content) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[32 * 1024] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, sizeof(buf)))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    content->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path, const std::string& content) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.c_str() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (close(fd) == -1) return errno;
  if (chmod(temp_file.c_str(), S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1)
    return errno;
  if (rename(temp_file.c_str(), path.c_str()) == -1) return errno;
  return 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::string content;
  int err = OsRead(path, &content);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return content;
}

void File::Write(const std::string& path, const std::string& content) {
  MakeDirs(BaseDir(path));
  int err = OsWrite(path, content);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::RemoveTree(const std::string& path) {
  OsMakeTreeWritable(path);
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(), "removetree");
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  return path.substr(0, path.find_last_of(kPathSeparators));
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || path_.empty()) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << e.what();
  }
}

}  // namespace util
