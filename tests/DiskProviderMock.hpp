#include "IDiskProvider.hpp"
#include "TransferErrors.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace MediaMover
{
/**
 * @brief in-memory file tree, failures are injected through the public
 * members
 */
class DiskProviderMock : public IDiskProvider
{
public:
  std::map<std::string, uint64_t> files;
  std::set<std::string> folders;

  bool hardLinkSupported = true;
  bool renameSupported = true;
  // the first n copies stop after incompleteSize bytes
  int incompleteCopies = 0;
  uint64_t incompleteSize = 900;
  std::set<std::string> undeletable;
  // copies stop after the target was created, the partial target is removed
  std::set<std::string> failingCopies;
  // copies fail before the target is touched
  std::set<std::string> unreadable;
  std::function<void(int)> onCopy;

  int copyCalls = 0;
  int moveCalls = 0;
  std::vector<std::pair<std::string, std::string>> hardLinks;
  std::vector<std::string> deleted;
  // pairs of names sharing one inode
  std::set<std::pair<std::string, std::string>> links;

  static std::string parentOf(const std::string &path)
  {
    const auto pos = path.rfind('/');
    return pos == 0 ? "/" : path.substr(0, pos);
  }

  bool fileExists(const std::string &path) override
  {
    return files.count(path) > 0;
  }

  uint64_t getFileSize(const std::string &path) override
  {
    const auto it = files.find(path);
    if(it == files.end())
      throw IOError("No such file: " + path);
    return it->second;
  }

  bool isSameFile(const std::string &a, const std::string &b) override
  {
    return files.count(a) && files.count(b) &&
      (links.count({a, b}) || links.count({b, a}));
  }

  void forgetLinks(const std::string &path)
  {
    for(auto it = links.begin(); it != links.end();)
    {
      if(it->first == path || it->second == path)
        it = links.erase(it);
      else
        ++it;
    }
  }

  bool tryCreateHardLink(
    const std::string &source, const std::string &target) override
  {
    hardLinks.emplace_back(source, target);
    if(!hardLinkSupported || !files.count(source) || files.count(target))
      return false;
    files[target] = files[source];
    links.emplace(source, target);
    return true;
  }

  void copySingleFile(const std::string &source, const std::string &target,
    bool overwrite) override
  {
    if(!files.count(source) || unreadable.count(source))
      throw IOError("Could not open file: " + source);
    if(!overwrite && files.count(target))
      throw AlreadyExistsError("Target file already exists: " + target);

    ++copyCalls;
    if(failingCopies.count(source))
      throw IOError("Disk full: " + target);

    // opening the target truncates the shared inode
    if(isSameFile(source, target))
    {
      files[source] = 0;
      files[target] = 0;
      return;
    }
    files[target] =
      copyCalls <= incompleteCopies ? incompleteSize : files[source];

    if(onCopy)
      onCopy(copyCalls);
  }

  void moveSingleFile(const std::string &source, const std::string &target,
    bool overwrite) override
  {
    ++moveCalls;
    if(!renameSupported)
      throw IOError("Invalid cross-device link: " + target);
    if(!files.count(source))
      throw IOError("No such file: " + source);
    if(!overwrite && files.count(target))
      throw AlreadyExistsError("Target file already exists: " + target);

    forgetLinks(target);
    for(auto link: std::vector<std::pair<std::string, std::string>>(
          links.begin(), links.end()))
    {
      if(link.first != source && link.second != source)
        continue;
      links.erase(link);
      if(link.first == source)
        link.first = target;
      else
        link.second = target;
      links.insert(link);
    }

    files[target] = files[source];
    files.erase(source);
  }

  void deleteFile(const std::string &path) override
  {
    if(undeletable.count(path))
      throw IOError("Permission denied: " + path);
    if(!files.erase(path))
      throw IOError("No such file: " + path);
    forgetLinks(path);
    deleted.push_back(path);
  }

  bool folderExists(const std::string &path) override
  {
    return folders.count(path) > 0;
  }

  void createFolder(const std::string &path) override
  {
    for(auto p = path; p != "/" && !folders.count(p); p = parentOf(p))
      folders.insert(p);
  }

  void deleteFolder(const std::string &path, bool recursive) override
  {
    if(!folders.count(path))
      throw IOError("No such folder: " + path);

    const auto prefix = path + '/';
    auto inside = [&](const std::string &p) {
      return p.compare(0, prefix.size(), prefix) == 0;
    };

    for(auto it = files.begin(); it != files.end();)
    {
      if(!inside(it->first))
      {
        ++it;
        continue;
      }
      if(!recursive)
        throw IOError("Folder not empty: " + path);
      it = files.erase(it);
    }

    for(auto it = folders.begin(); it != folders.end();)
    {
      if(!inside(*it))
      {
        ++it;
        continue;
      }
      if(!recursive)
        throw IOError("Folder not empty: " + path);
      it = folders.erase(it);
    }
    folders.erase(path);
  }

  std::vector<DirectoryEntry> getDirectoryEntries(
    const std::string &path) override
  {
    if(!folders.count(path))
      throw IOError("No such folder: " + path);

    std::vector<DirectoryEntry> entries;
    for(const auto &f: folders)
    {
      if(f != path && parentOf(f) == path)
        entries.push_back(DirectoryEntry{f.substr(path.size() + 1), true});
    }
    for(const auto &f: files)
    {
      if(parentOf(f.first) == path)
        entries.push_back(
          DirectoryEntry{f.first.substr(path.size() + 1), false});
    }
    return entries;
  }
};
}
