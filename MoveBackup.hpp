#ifndef __MOVEBACKUP_HPP__
#define __MOVEBACKUP_HPP__

#include <string>

#include "IDiskProvider.hpp"

namespace MediaMover
{
/**
 * @brief hard link of a file that is about to be moved, kept next to it as
 * <source><suffix> for the duration of one move. The link is deleted on
 * release() or at the latest when the object goes out of scope, so it never
 * outlives the transfer call, whatever way the call ends.
 */
class MoveBackup
{
public:
  MoveBackup(IDiskProvider &disk, const std::string &source,
    const std::string &suffix);
  MoveBackup(const MoveBackup &) = delete;
  MoveBackup &operator=(const MoveBackup &) = delete;
  ~MoveBackup();

  /**
   * @brief create the link. A leftover from an interrupted earlier move is
   * removed first.
   *
   * @return false the filesystem cannot hard link the source, no backup
   * exists
   */
  bool acquire();

  /**
   * @brief delete the link, errors are logged but not thrown
   *
   * @return false the link could not be deleted and is still on disk
   */
  bool release();

  bool isHeld() const { return m_held; }
  const std::string &path() const { return m_path; }

private:
  IDiskProvider &m_disk;
  std::string m_source;
  std::string m_path;
  bool m_held;
};
}

#endif // !__MOVEBACKUP_HPP__
