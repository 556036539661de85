#ifndef __DISKPROVIDERLINUX_HPP__
#define __DISKPROVIDERLINUX_HPP__

#include <time.h>

#include "IDiskProvider.hpp"

namespace MediaMover
{
class DiskProviderLinux : public IDiskProvider
{
public:
  static constexpr size_t DefaultBufferSize = 256 * 1024;

  explicit DiskProviderLinux(size_t bufferSize = DefaultBufferSize);
  ~DiskProviderLinux() = default;

  bool fileExists(const std::string &path) override;
  uint64_t getFileSize(const std::string &path) override;
  bool isSameFile(const std::string &a, const std::string &b) override;
  bool tryCreateHardLink(
    const std::string &source, const std::string &target) override;
  void copySingleFile(const std::string &source, const std::string &target,
    bool overwrite) override;
  void moveSingleFile(const std::string &source, const std::string &target,
    bool overwrite) override;
  void deleteFile(const std::string &path) override;

  bool folderExists(const std::string &path) override;
  void createFolder(const std::string &path) override;
  void deleteFolder(const std::string &path, bool recursive) override;
  std::vector<DirectoryEntry> getDirectoryEntries(
    const std::string &path) override;

  void getFileTimes(const std::string &path, timespec times[2]);
  void setFileTimes(const std::string &path, const timespec times[2]);

private:
  size_t m_bufferSize;
};
}

#endif // !__DISKPROVIDERLINUX_HPP__
