#include "DiskProviderLinux.hpp"

#include <unistd.h>
#include <stdio.h>
#include <stdlib.h>
#include <fcntl.h>
#include <errno.h>
#include <dirent.h>
#include <string.h>
#include <time.h>
#include <sys/time.h>
#include <sys/stat.h>

#include <memory>
#include <sstream>

#include "TransferErrors.hpp"
#include "loguru.hpp"

namespace
{
void throwErrno(const char *what, const std::string &path)
{
  const int err = errno;
  std::stringstream ss;
  ss << what << " '" << path << "': " << strerror(err);
  throw MediaMover::IOError(ss.str());
}

class FileHandle
{
public:
  explicit FileHandle(int fd)
    : m_fd(fd)
  {
  }
  FileHandle(const FileHandle &) = delete;
  ~FileHandle()
  {
    if(m_fd >= 0)
      ::close(m_fd);
  }

  int get() const { return m_fd; }

  int close()
  {
    const int fd = m_fd;
    m_fd = -1;
    return ::close(fd);
  }

private:
  int m_fd;
};

std::string childPath(const std::string &folder, const char *name)
{
  if(!folder.empty() && folder.back() == '/')
    return folder + name;
  return folder + '/' + name;
}
}

namespace MediaMover
{
DiskProviderLinux::DiskProviderLinux(size_t bufferSize)
  : m_bufferSize(bufferSize ? bufferSize : DefaultBufferSize)
{
}

bool DiskProviderLinux::fileExists(const std::string &path)
{
  struct stat finfo;
  return stat(path.c_str(), &finfo) == 0 && !S_ISDIR(finfo.st_mode);
}

uint64_t DiskProviderLinux::getFileSize(const std::string &path)
{
  struct stat finfo;
  if(stat(path.c_str(), &finfo))
  {
    throwErrno("Error stat", path);
  }

  return finfo.st_size;
}

bool DiskProviderLinux::isSameFile(const std::string &a, const std::string &b)
{
  struct stat ainfo, binfo;
  if(stat(a.c_str(), &ainfo) || stat(b.c_str(), &binfo))
    return false;

  return ainfo.st_dev == binfo.st_dev && ainfo.st_ino == binfo.st_ino;
}

bool DiskProviderLinux::tryCreateHardLink(
  const std::string &source, const std::string &target)
{
  if(link(source.c_str(), target.c_str()))
  {
    LOG_F(2, "Hard link '%s' -> '%s' failed: %s", source.c_str(),
      target.c_str(), strerror(errno));
    return false;
  }
  return true;
}

void DiskProviderLinux::copySingleFile(
  const std::string &source, const std::string &target, bool overwrite)
{
  struct stat finfo;

  FileHandle s(open(source.c_str(), O_RDONLY | O_CLOEXEC));
  if(s.get() < 0)
    throwErrno("Could not open file", source);

  if(fstat(s.get(), &finfo))
    throwErrno("Error stat", source);

  posix_fadvise(s.get(), 0, 0, POSIX_FADV_SEQUENTIAL);

  const int flags =
    O_WRONLY | O_CREAT | O_CLOEXEC | (overwrite ? O_TRUNC : O_EXCL);
  FileHandle d(open(target.c_str(), flags, finfo.st_mode & 07777));
  if(d.get() < 0)
  {
    if(errno == EEXIST)
      throw AlreadyExistsError(
        std::string("Target file already exists: ") + target);
    throwErrno("Could not create file", target);
  }

  try
  {
    // reserve the space without growing the visible size, a short copy must
    // stay detectable by its size
    if(finfo.st_size > 0 &&
      fallocate(d.get(), FALLOC_FL_KEEP_SIZE, 0, finfo.st_size) &&
      errno == ENOSPC)
    {
      throwErrno("Not enough space for", target);
    }

    std::unique_ptr<char[]> buf(new char[m_bufferSize]);
    while(true)
    {
      auto rs = read(s.get(), buf.get(), m_bufferSize);
      if(rs < 0)
      {
        if(errno == EINTR)
          continue;
        throwErrno("IO error while reading", source);
      }
      if(!rs)
        break;

      const char *p = buf.get();
      while(rs > 0)
      {
        const auto ws = write(d.get(), p, rs);
        if(ws < 0)
        {
          if(errno == EINTR)
            continue;
          throwErrno("IO error during copying the file to", target);
        }
        p += ws;
        rs -= ws;
      }
    }

    const timespec ts[2] = {finfo.st_atim, finfo.st_mtim};
    if(futimens(d.get(), ts))
      throwErrno("Error modifying time", target);

    if(d.close())
      throwErrno("Error closing", target);
  }
  catch(const IOError &)
  {
    if(unlink(target.c_str()))
      LOG_F(WARNING, "Partial file '%s' cannot be removed: %s", target.c_str(),
        strerror(errno));
    throw;
  }
}

void DiskProviderLinux::moveSingleFile(
  const std::string &source, const std::string &target, bool overwrite)
{
  struct stat finfo;
  if(!overwrite && lstat(target.c_str(), &finfo) == 0)
  {
    throw AlreadyExistsError(
      std::string("Target file already exists: ") + target);
  }

  if(rename(source.c_str(), target.c_str()))
  {
    const int err = errno;
    std::stringstream ss;
    ss << "Error during moving file '" << source << "' to '" << target
       << "': " << strerror(err);
    throw IOError(ss.str());
  }
}

void DiskProviderLinux::deleteFile(const std::string &path)
{
  if(unlink(path.c_str()))
    throwErrno("Could not delete file", path);
}

bool DiskProviderLinux::folderExists(const std::string &path)
{
  struct stat finfo;
  return stat(path.c_str(), &finfo) == 0 && S_ISDIR(finfo.st_mode);
}

void DiskProviderLinux::createFolder(const std::string &path)
{
  if(path.empty())
    throw IOError("Could not create folder with empty name");

  size_t pos = 0;
  do
  {
    pos = path.find('/', pos + 1);
    const auto part = path.substr(0, pos);
    if(mkdir(part.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) &&
      (errno != EEXIST || !folderExists(part)))
    {
      throwErrno("Could not create folder", part);
    }
  } while(pos != std::string::npos);
}

void DiskProviderLinux::deleteFolder(const std::string &path, bool recursive)
{
  if(recursive)
  {
    for(const auto &entry: getDirectoryEntries(path))
    {
      const auto child = childPath(path, entry.name.c_str());
      if(entry.isDirectory)
        deleteFolder(child, true);
      else
        deleteFile(child);
    }
  }

  if(rmdir(path.c_str()))
    throwErrno("Could not delete folder", path);
}

std::vector<DirectoryEntry> DiskProviderLinux::getDirectoryEntries(
  const std::string &path)
{
  std::unique_ptr<DIR, decltype(&closedir)> dir(
    opendir(path.c_str()), closedir);
  if(!dir)
    throwErrno("Could not open folder", path);

  std::vector<DirectoryEntry> entries;
  while(true)
  {
    errno = 0;
    const struct dirent *e = readdir(dir.get());
    if(!e)
    {
      if(errno)
        throwErrno("Could not read folder", path);
      break;
    }

    if(!strcmp(e->d_name, ".") || !strcmp(e->d_name, ".."))
      continue;

    bool isDir = e->d_type == DT_DIR;
    if(e->d_type == DT_UNKNOWN)
    {
      struct stat finfo;
      const auto child = childPath(path, e->d_name);
      if(lstat(child.c_str(), &finfo))
        throwErrno("Error stat", child);
      isDir = S_ISDIR(finfo.st_mode);
    }
    entries.push_back(DirectoryEntry{e->d_name, isDir});
  }

  return entries;
}

void DiskProviderLinux::getFileTimes(const std::string &path, timespec times[2])
{
  struct stat finfo;
  if(stat(path.c_str(), &finfo))
  {
    throwErrno("Error stat", path);
  }
  times[0] = finfo.st_atim;
  times[1] = finfo.st_mtim;
}

void DiskProviderLinux::setFileTimes(
  const std::string &path, const timespec times[2])
{
  if(utimensat(AT_FDCWD, path.c_str(), times, 0))
  {
    throwErrno("Error modifying time", path);
  }
}
}
