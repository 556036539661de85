#include "MoveBackup.hpp"

#include "TransferErrors.hpp"
#include "loguru.hpp"

namespace MediaMover
{
MoveBackup::MoveBackup(
  IDiskProvider &disk, const std::string &source, const std::string &suffix)
  : m_disk(disk)
  , m_source(source)
  , m_path(source + suffix)
  , m_held(false)
{
}

MoveBackup::~MoveBackup()
{
  release();
}

bool MoveBackup::acquire()
{
  if(m_held)
    return true;

  try
  {
    if(m_disk.fileExists(m_path))
    {
      LOG_F(WARNING, "Removing stale move backup '%s'", m_path.c_str());
      m_disk.deleteFile(m_path);
    }
  }
  catch(const IOError &e)
  {
    LOG_F(WARNING, "Stale move backup cannot be removed: %s", e.what());
    return false;
  }

  m_held = m_disk.tryCreateHardLink(m_source, m_path);
  LOG_F(2, "Move backup '%s' %s", m_path.c_str(),
    m_held ? "created" : "not supported");
  return m_held;
}

bool MoveBackup::release()
{
  if(!m_held)
    return true;

  m_held = false;
  try
  {
    if(m_disk.fileExists(m_path))
    {
      m_disk.deleteFile(m_path);
    }
    LOG_F(2, "Move backup '%s' removed", m_path.c_str());
    return true;
  }
  catch(const std::exception &e)
  {
    LOG_F(WARNING, "Could not remove move backup '%s': %s", m_path.c_str(),
      e.what());
  }
  return false;
}
}
