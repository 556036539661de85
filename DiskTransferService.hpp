#ifndef __DISKTRANSFERSERVICE_HPP__
#define __DISKTRANSFERSERVICE_HPP__

#include <set>
#include <string>
#include <exception>

#include "IDiskProvider.hpp"
#include "TransferTypes.hpp"
#include "TransferErrors.hpp"
#include "TransferConfig.hpp"
#include "CancellationToken.hpp"

namespace MediaMover
{
class DiskTransferService
{
public:
  DiskTransferService(IDiskProvider &disk, const TransferConfig &cfg,
    const CancellationToken *cancel = nullptr);
  DiskTransferService(const DiskTransferService &) = delete;
  ~DiskTransferService() = default;

  /**
   * @brief transfer a single file and verify the result
   *
   * @return the mode actually achieved
   * @throw TransferError subclasses, std::invalid_argument for malformed
   * paths
   */
  TransferMode transferFileVerified(const std::string &source,
    const std::string &target, TransferMode mode, bool allowOverwrite = false);

  /**
   * @brief same as transferFileVerified(), but also reports whether the
   * source or the move backup had to be left on disk
   */
  TransferOutcome transfer(const TransferRequest &request);

  /**
   * @brief merge the source tree into target, file by file. Files failing
   * to transfer do not stop their siblings, but keep every folder above
   * them from being removed in Move mode. The first failure is rethrown
   * once the whole tree was walked.
   */
  void transferFolder(
    const std::string &source, const std::string &target, TransferMode mode);

  static constexpr const char *PendingLinkSuffix = ".linkpending";

protected:
  enum class MoveStep
  {
    CreateBackup,
    Rename,
    CopyAndDelete,
    Done,
  };

  void hardLink(const TransferRequest &request);
  void copyVerified(
    const std::string &source, const std::string &target, bool overwrite);
  TransferOutcome move(const TransferRequest &request);
  bool deleteSource(const std::string &source);
  void removePartialTarget(const std::string &target);
  void checkCancelled(const std::string &path) const;
  bool isBackupOf(const std::string &name,
    const std::set<std::string> &fileNames) const;
  bool transferFolderTree(const std::string &source,
    const std::string &target, TransferMode mode,
    std::exception_ptr &firstError);

private:
  IDiskProvider &m_disk;
  const TransferConfig &m_cfg;
  const CancellationToken *m_cancel;
};
}

#endif // !__DISKTRANSFERSERVICE_HPP__
