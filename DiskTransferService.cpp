#include "DiskTransferService.hpp"

#include <set>
#include <stdexcept>

#include "MoveBackup.hpp"
#include "loguru.hpp"

namespace
{
std::string normalizePath(const std::string &path)
{
  auto p = path;
  while(p.size() > 1 && p.back() == '/')
    p.pop_back();
  return p;
}

std::string combinePath(const std::string &folder, const std::string &name)
{
  if(!folder.empty() && folder.back() == '/')
    return folder + name;
  return folder + '/' + name;
}

bool isNestedIn(const std::string &path, const std::string &folder)
{
  const auto prefix = folder == "/" ? folder : folder + '/';
  return path.compare(0, prefix.size(), prefix) == 0;
}

void validatePaths(const std::string &source, const std::string &target)
{
  if(source.empty() || target.empty())
  {
    throw std::invalid_argument("Source and target path must not be empty");
  }

  if(source.front() != '/' || target.front() != '/')
  {
    throw std::invalid_argument(
      std::string("Paths must be absolute: '") + source + "', '" + target +
      "'");
  }

  if(normalizePath(source) == normalizePath(target))
  {
    throw std::invalid_argument(
      std::string("Source and target are the same path: ") + source);
  }
}
}

namespace MediaMover
{
DiskTransferService::DiskTransferService(IDiskProvider &disk,
  const TransferConfig &cfg, const CancellationToken *cancel)
  : m_disk(disk)
  , m_cfg(cfg)
  , m_cancel(cancel)
{
}

TransferMode DiskTransferService::transferFileVerified(
  const std::string &source, const std::string &target, TransferMode mode,
  bool allowOverwrite)
{
  return transfer(TransferRequest{source, target, mode, allowOverwrite})
    .achieved;
}

TransferOutcome DiskTransferService::transfer(const TransferRequest &request)
{
  validatePaths(request.source, request.target);
  LOG_SCOPE_F(2, "%s '%s' -> '%s'", toString(request.mode),
    request.source.c_str(), request.target.c_str());

  checkCancelled(request.source);

  if(!m_disk.fileExists(request.source))
  {
    throw IOError(std::string("Source file does not exist: ") + request.source);
  }

  if(m_disk.folderExists(request.target))
  {
    throw IOError(std::string("Target is a folder: ") + request.target);
  }

  if(!request.allowOverwrite && m_disk.fileExists(request.target))
  {
    throw AlreadyExistsError(
      std::string("Target file already exists: ") + request.target);
  }

  TransferOutcome outcome{request.mode, false, false};
  switch(request.mode)
  {
    case TransferMode::HardLink: hardLink(request); break;
    case TransferMode::Copy:
      copyVerified(request.source, request.target, request.allowOverwrite);
      break;
    case TransferMode::Move: outcome = move(request); break;
    default: throw std::invalid_argument("Unknown transfer mode");
  }

  LOG_F(1, "'%s' -> '%s' transferred (%s)", request.source.c_str(),
    request.target.c_str(), toString(outcome.achieved));
  return outcome;
}

void DiskTransferService::hardLink(const TransferRequest &request)
{
  if(!m_disk.fileExists(request.target))
  {
    if(!m_disk.tryCreateHardLink(request.source, request.target))
    {
      throw UnsupportedOperationError(std::string("Could not hard link '") +
        request.source + "' to '" + request.target + "'");
    }
    return;
  }

  if(m_disk.isSameFile(request.source, request.target))
  {
    LOG_F(1, "'%s' already links '%s'", request.target.c_str(),
      request.source.c_str());
    return;
  }

  // the old target is only replaced once the new link exists
  const auto pending = request.target + PendingLinkSuffix;
  if(m_disk.fileExists(pending))
  {
    m_disk.deleteFile(pending);
  }

  if(!m_disk.tryCreateHardLink(request.source, pending))
  {
    throw UnsupportedOperationError(std::string("Could not hard link '") +
      request.source + "' to '" + request.target + "'");
  }

  try
  {
    m_disk.moveSingleFile(pending, request.target, true);
  }
  catch(const IOError &)
  {
    removePartialTarget(pending);
    throw;
  }
}

void DiskTransferService::copyVerified(
  const std::string &source, const std::string &target, bool overwrite)
{
  const uint64_t expected = m_disk.getFileSize(source);

  // truncating another name of the source would destroy the source itself
  if(overwrite && m_disk.isSameFile(source, target))
  {
    LOG_F(1, "'%s' links '%s', replacing it by a copy", target.c_str(),
      source.c_str());
    m_disk.deleteFile(target);
  }

  for(int attempt = 1;; ++attempt)
  {
    try
    {
      m_disk.copySingleFile(source, target, overwrite);
    }
    catch(const IOError &e)
    {
      LOG_F(ERROR, "Copying '%s' failed: %s", source.c_str(), e.what());
      throw;
    }

    const uint64_t actual = m_disk.getFileSize(target);
    if(actual == expected)
    {
      LOG_F(2, "'%s' verified, %llu bytes", target.c_str(),
        static_cast<unsigned long long>(actual));
      return;
    }

    removePartialTarget(target);

    if(attempt >= m_cfg.copyAttempts)
    {
      LOG_F(ERROR,
        "Copy of '%s' still incomplete after %d attempts (%llu of %llu "
        "bytes)",
        source.c_str(), attempt, static_cast<unsigned long long>(actual),
        static_cast<unsigned long long>(expected));
      throw IncompleteTransferError(
        std::string("File was not completely transferred: ") + target);
    }

    LOG_F(WARNING, "Target '%s' is incomplete (%llu of %llu bytes), retry %d",
      target.c_str(), static_cast<unsigned long long>(actual),
      static_cast<unsigned long long>(expected), attempt);

    checkCancelled(source);
  }
}

TransferOutcome DiskTransferService::move(const TransferRequest &request)
{
  MoveBackup backup(m_disk, request.source, m_cfg.backupSuffix);
  TransferOutcome outcome{TransferMode::Move, false, false};
  auto step = MoveStep::CreateBackup;

  while(step != MoveStep::Done)
  {
    checkCancelled(request.source);

    switch(step)
    {
      case MoveStep::CreateBackup:
        if(backup.acquire())
        {
          step = MoveStep::Rename;
        }
        else
        {
          LOG_F(1, "No hard link backup for '%s', moving by copy",
            request.source.c_str());
          step = MoveStep::CopyAndDelete;
        }
        break;

      case MoveStep::Rename:
        try
        {
          m_disk.moveSingleFile(
            request.source, request.target, request.allowOverwrite);
          // rename() is a no-op when target already links the same inode
          if(m_disk.fileExists(request.source))
          {
            outcome.sourceRetained = !deleteSource(request.source);
          }
          step = MoveStep::Done;
        }
        catch(const IOError &e)
        {
          LOG_F(1, "Rename not possible, moving by copy: %s", e.what());
          step = MoveStep::CopyAndDelete;
        }
        break;

      case MoveStep::CopyAndDelete:
        copyVerified(request.source, request.target, request.allowOverwrite);
        outcome.sourceRetained = !deleteSource(request.source);
        step = MoveStep::Done;
        break;

      case MoveStep::Done: break;
    }
  }

  outcome.backupRetained = !backup.release();
  return outcome;
}

bool DiskTransferService::deleteSource(const std::string &source)
{
  try
  {
    m_disk.deleteFile(source);
    return true;
  }
  catch(const IOError &e)
  {
    LOG_F(WARNING, "'%s' was copied, but the source cannot be removed: %s",
      source.c_str(), e.what());
  }
  return false;
}

void DiskTransferService::removePartialTarget(const std::string &target)
{
  try
  {
    if(m_disk.fileExists(target))
    {
      m_disk.deleteFile(target);
    }
  }
  catch(const IOError &e)
  {
    LOG_F(WARNING, "Partial file '%s' cannot be removed: %s", target.c_str(),
      e.what());
  }
}

void DiskTransferService::checkCancelled(const std::string &path) const
{
  if(m_cancel && m_cancel->isCancelled())
  {
    LOG_F(WARNING, "Transfer of '%s' cancelled", path.c_str());
    throw CancelledError(std::string("Transfer cancelled: ") + path);
  }
}

void DiskTransferService::transferFolder(
  const std::string &source, const std::string &target, TransferMode mode)
{
  validatePaths(source, target);
  const auto src = normalizePath(source);
  const auto dst = normalizePath(target);

  if(isNestedIn(dst, src))
  {
    throw std::invalid_argument(std::string("Target folder '") + dst +
      "' is inside the source folder '" + src + "'");
  }

  checkCancelled(src);

  if(!m_disk.folderExists(src))
  {
    throw IOError(std::string("Source folder does not exist: ") + src);
  }

  LOG_F(INFO, "%s folder '%s' -> '%s'", toString(mode), src.c_str(),
    dst.c_str());

  std::exception_ptr firstError;
  transferFolderTree(src, dst, mode, firstError);

  if(firstError)
  {
    std::rethrow_exception(firstError);
  }
}

bool DiskTransferService::isBackupOf(
  const std::string &name, const std::set<std::string> &fileNames) const
{
  const auto &suffix = m_cfg.backupSuffix;
  return name.size() > suffix.size() &&
    name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0 &&
    fileNames.count(name.substr(0, name.size() - suffix.size())) > 0;
}

bool DiskTransferService::transferFolderTree(const std::string &source,
  const std::string &target, TransferMode mode,
  std::exception_ptr &firstError)
{
  if(!m_disk.folderExists(target))
  {
    m_disk.createFolder(target);
  }

  const auto entries = m_disk.getDirectoryEntries(source);
  std::set<std::string> fileNames;
  for(const auto &entry: entries)
  {
    if(!entry.isDirectory)
      fileNames.insert(entry.name);
  }

  bool complete = true;
  bool retained = false;
  for(const auto &entry: entries)
  {
    const auto childSource = combinePath(source, entry.name);
    const auto childTarget = combinePath(target, entry.name);

    // leftover backup of a sibling, that sibling's move takes care of it
    if(!entry.isDirectory && isBackupOf(entry.name, fileNames))
    {
      LOG_F(1, "Skipping stale move backup '%s'", childSource.c_str());
      continue;
    }

    try
    {
      if(entry.isDirectory)
      {
        if(!transferFolderTree(childSource, childTarget, mode, firstError))
          complete = false;
      }
      else
      {
        const auto outcome =
          transfer(TransferRequest{childSource, childTarget, mode, true});
        if(outcome.sourceRetained || outcome.backupRetained)
        {
          retained = true;
          complete = false;
        }
      }
    }
    catch(const CancelledError &)
    {
      throw;
    }
    catch(const TransferError &e)
    {
      LOG_F(ERROR, "Transfer of '%s' failed: %s", childSource.c_str(),
        e.what());
      complete = false;
      if(!firstError)
      {
        firstError = std::current_exception();
      }
    }
  }

  // children first, the folder itself only when nothing is left behind
  if(complete && mode == TransferMode::Move)
  {
    m_disk.deleteFolder(source, false);
    LOG_F(2, "Source folder '%s' removed", source.c_str());
  }
  else if(retained && mode == TransferMode::Move)
  {
    LOG_F(WARNING, "Source folder '%s' kept, it still holds moved files",
      source.c_str());
  }

  return complete;
}
}
