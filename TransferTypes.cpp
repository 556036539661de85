#include "TransferTypes.hpp"

#include <locale>

namespace MediaMover
{
const char *toString(TransferMode mode)
{
  switch(mode)
  {
    case TransferMode::HardLink: return "HardLink";
    case TransferMode::Copy: return "Copy";
    case TransferMode::Move: return "Move";
  }
  return "Unknown";
}

bool parseTransferMode(const std::string &name, TransferMode &mode)
{
  auto k = name;
  auto &f = std::use_facet<std::ctype<char>>(std::locale());
  f.tolower(&k[0], &k[0] + k.size());

  if(k == "hardlink")
    mode = TransferMode::HardLink;
  else if(k == "copy")
    mode = TransferMode::Copy;
  else if(k == "move")
    mode = TransferMode::Move;
  else
    return false;

  return true;
}
}
