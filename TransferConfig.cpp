#include "TransferConfig.hpp"

#include <errno.h>
#include <stdlib.h>
#include <locale>

#include "DiskProviderLinux.hpp"

namespace
{
bool toNumber(const std::string &value, long long &number)
{
  if(value.empty())
    return false;

  char *end = nullptr;
  errno = 0;
  number = strtoll(value.c_str(), &end, 10);
  return errno == 0 && *end == '\0';
}

bool toBool(std::string value, bool &flag)
{
  auto &f = std::use_facet<std::ctype<char>>(std::locale());
  f.tolower(&value[0], &value[0] + value.size());

  if(value == "1" || value == "true" || value == "yes" || value == "on")
    flag = true;
  else if(value == "0" || value == "false" || value == "no" || value == "off")
    flag = false;
  else
    return false;

  return true;
}
}

namespace MediaMover
{
TransferConfig defaultTransferConfig()
{
  return TransferConfig{
    .verbosity = 0,
    .copyAttempts = 3,
    .copyBufferSize = DiskProviderLinux::DefaultBufferSize,
    .backupSuffix = ".movebackup",
    .logFile = "",
    .transferMode = TransferMode::Move,
    .allowOverwrite = false,
  };
}

template<>
bool MediaMoverConfig<TransferConfig>::parse(
  const std::string &key, const std::string &value, TransferConfig &config)
{
  auto k = key;
  auto &f = std::use_facet<std::ctype<char>>(std::locale());
  f.tolower(&k[0], &k[0] + k.size());

  long long number = 0;

  if(k == "verbosity")
  {
    if(!toNumber(value, number))
      return false;
    config.verbosity = static_cast<int>(number);
  }
  else if(k == "copyattempts")
  {
    if(!toNumber(value, number) || number < 1 || number > 100)
      return false;
    config.copyAttempts = static_cast<int>(number);
  }
  else if(k == "copybuffersize")
  {
    if(!toNumber(value, number) || number < 4096)
      return false;
    config.copyBufferSize = static_cast<size_t>(number);
  }
  else if(k == "backupsuffix")
  {
    if(value.empty() || value.find('/') != std::string::npos)
      return false;
    config.backupSuffix = value;
  }
  else if(k == "logfile")
  {
    config.logFile = value;
  }
  else if(k == "transfermode")
  {
    return parseTransferMode(value, config.transferMode);
  }
  else if(k == "allowoverwrite")
  {
    return toBool(value, config.allowOverwrite);
  }
  else
    return false;

  return true;
}
}
