#ifndef __IDISKPROVIDER_HPP__
#define __IDISKPROVIDER_HPP__

#include <cstdint>
#include <string>
#include <vector>

namespace MediaMover
{
struct DirectoryEntry
{
  std::string name;
  bool isDirectory;
};

/**
 * @brief filesystem primitives used by the transfer engine. None of them
 * retries. Failures are reported by throwing IOError, or AlreadyExistsError
 * when the target is present and overwriting was not permitted.
 */
class IDiskProvider
{
public:
  virtual bool fileExists(const std::string &path) = 0;
  virtual uint64_t getFileSize(const std::string &path) = 0;

  /**
   * @brief true if both paths resolve to the same data (hard links of one
   * another, or a symlink to the other). False if either does not exist.
   */
  virtual bool isSameFile(const std::string &a, const std::string &b) = 0;

  /**
   * @brief create a hard link at target referencing source's data
   *
   * @return false if the link could not be made for any reason (other
   * volume, unsupported by the filesystem, permissions, existing target)
   */
  virtual bool tryCreateHardLink(
    const std::string &source, const std::string &target) = 0;

  /**
   * @brief copy source's data and times to target. A target left partially
   * written by a failed copy is removed before the error is thrown; a
   * failure before the target was opened leaves it untouched.
   */
  virtual void copySingleFile(
    const std::string &source, const std::string &target, bool overwrite) = 0;
  virtual void moveSingleFile(
    const std::string &source, const std::string &target, bool overwrite) = 0;
  virtual void deleteFile(const std::string &path) = 0;

  virtual bool folderExists(const std::string &path) = 0;
  virtual void createFolder(const std::string &path) = 0;
  virtual void deleteFolder(const std::string &path, bool recursive) = 0;
  virtual std::vector<DirectoryEntry> getDirectoryEntries(
    const std::string &path) = 0;

  virtual ~IDiskProvider() = default;
};
}

#endif // !__IDISKPROVIDER_HPP__
