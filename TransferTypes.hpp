#ifndef __TRANSFERTYPES_HPP__
#define __TRANSFERTYPES_HPP__

#include <cstdint>
#include <string>

namespace MediaMover
{
enum class TransferMode : int8_t
{
  HardLink = 1,
  Copy,
  Move,
};

struct TransferRequest
{
  std::string source;
  std::string target;
  TransferMode mode;
  bool allowOverwrite;
};

struct TransferOutcome
{
  TransferMode achieved;
  // the backup link could not be deleted and is still on disk
  bool backupRetained;
  // data is complete at target, but the source could not be removed
  bool sourceRetained;
};

const char *toString(TransferMode mode);
bool parseTransferMode(const std::string &name, TransferMode &mode);
}

#endif // !__TRANSFERTYPES_HPP__
