#ifndef __TRANSFERCONFIG_HPP__
#define __TRANSFERCONFIG_HPP__

#include <string>

#include "MediaMoverConfig.hpp"
#include "TransferTypes.hpp"

namespace MediaMover
{
struct TransferConfig
{
  int verbosity;
  int copyAttempts;
  size_t copyBufferSize;
  std::string backupSuffix;
  std::string logFile;
  TransferMode transferMode;
  bool allowOverwrite;
};

TransferConfig defaultTransferConfig();

template<>
bool MediaMoverConfig<TransferConfig>::parse(
  const std::string &key, const std::string &value, TransferConfig &config);
}

#endif
