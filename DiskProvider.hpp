#ifndef __DISKPROVIDER_HPP__
#define __DISKPROVIDER_HPP__

#if defined(__linux__)
  #include "DiskProviderLinux.hpp"
namespace MediaMover
{
using DiskProvider = DiskProviderLinux;
}
#else
  #error "No disk provider available for this platform"
#endif

#endif // __DISKPROVIDER_HPP__
