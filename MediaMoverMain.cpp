#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <signal.h>
#include <getopt.h>

#include <iostream>
#include <string>

#include "DiskProvider.hpp"
#include "DiskTransferService.hpp"
#include "TransferConfig.hpp"

#include "loguru.hpp"

using namespace std;

static MediaMover::TransferConfig gCfg = MediaMover::defaultTransferConfig();
static MediaMover::CancellationToken gCancel;

namespace
{
enum ExitCode
{
  Success = 0,
  Usage = 1,
  AlreadyExists = 2,
  UnsupportedOperation = 3,
  IncompleteTransfer = 4,
  IOFailure = 5,
  Cancelled = 6,
  PartialSuccess = 7,
};

int exitCodeOf(const MediaMover::TransferError &e)
{
  using Kind = MediaMover::TransferError::Kind;
  switch(e.kind())
  {
    case Kind::AlreadyExists: return AlreadyExists;
    case Kind::UnsupportedOperation: return UnsupportedOperation;
    case Kind::IncompleteTransfer: return IncompleteTransfer;
    case Kind::IOFailure: return IOFailure;
    case Kind::Cancelled: return Cancelled;
  }
  return IOFailure;
}

void showUsage(const char *name)
{
  cout
    << "Usage: " << name
    << " [-fh] [-v N] [-c configFile] [-l logfile] [-m mode] source target"
    << endl
    << "\t-m\thardlink, copy or move (default from config, else move)"
    << endl
    << "\t-f\tallow overwriting an existing target file" << endl
    << "\t-v\tverbosity level (-9 fatal -> 0 info -> 9 all)" << endl
    << "\t-h\tshow this help" << endl
    << "\t-c\tconfig file to use, by default MediaMover.cfg is used in local folder"
    << endl
    << "\t-l\tlog output file, override config file value" << endl
    << "A source folder is merged into the target folder file by file."
    << endl;
}
}

// first signal cancels between copy attempts, the second one kills
void signal_callback_handler(int signum)
{
  if(gCancel.isCancelled())
  {
    _exit(Cancelled);
  }
  gCancel.cancel();
}

int main(int argc, char **argv)
{
  std::string cfgFileName = "MediaMover.cfg";
  std::string logFile;
  std::string modeName;
  int c;
  auto v = loguru::Verbosity_INFO;
  bool verbosityOverridden = false;
  bool overwriteOverridden = false;
  bool showHelp = false;

  while((c = getopt(argc, argv, "c:l:m:v:fh")) != -1)
  {
    switch(c)
    {
      case 'c': cfgFileName = optarg; break;
      case 'l': logFile = optarg; break;
      case 'm': modeName = optarg; break;
      case 'v':
        verbosityOverridden = true;
        v = static_cast<loguru::NamedVerbosity>(atoi(optarg));
        break;
      case 'f': overwriteOverridden = true; break;
      case 'h': showHelp = true; break;

      default: showHelp = true; break;
    }
  }

  if(showHelp || argc - optind != 2)
  {
    showUsage(argv[0]);
    return Usage;
  }

  const std::string source = argv[optind];
  const std::string target = argv[optind + 1];

  loguru::g_internal_verbosity = 1;
  loguru::SignalOptions sigOpts;
  loguru::Options opts;

  sigOpts.sigint = false;
  sigOpts.sigterm = false;
  opts.signals = sigOpts;
  loguru::init(argc, argv, opts);

  MediaMover::MediaMoverConfig<MediaMover::TransferConfig> mac(gCfg);

  try
  {
    mac.read(cfgFileName);
  }
  catch(const std::exception &e)
  {
    LOG_F(ERROR, "%s: %s", cfgFileName.c_str(), e.what());
    return Usage;
  }

  // command line wins over config file values
  if(logFile.empty())
  {
    logFile = gCfg.logFile;
  }

  if(!verbosityOverridden)
  {
    v = static_cast<loguru::NamedVerbosity>(gCfg.verbosity);
  }
  loguru::g_stderr_verbosity = v;

  if(overwriteOverridden)
  {
    gCfg.allowOverwrite = true;
  }

  if(!modeName.empty() &&
    !MediaMover::parseTransferMode(modeName, gCfg.transferMode))
  {
    LOG_F(ERROR, "Unknown transfer mode '%s'", modeName.c_str());
    return Usage;
  }

  if(!logFile.empty())
  {
    if(!loguru::add_file(logFile.c_str(), loguru::FileMode::Append, v))
    {
      LOG_F(ERROR, "Cannot open logfile '%s' to write", logFile.c_str());
      return Usage;
    }
  }

  signal(SIGINT, signal_callback_handler);
  signal(SIGTERM, signal_callback_handler);

  MediaMover::DiskProvider disk(gCfg.copyBufferSize);
  MediaMover::DiskTransferService service(disk, gCfg, &gCancel);

  try
  {
    if(disk.folderExists(source))
    {
      service.transferFolder(source, target, gCfg.transferMode);
      LOG_F(INFO, "Folder '%s' transferred to '%s'", source.c_str(),
        target.c_str());
      return Success;
    }

    const auto outcome = service.transfer(MediaMover::TransferRequest{
      source, target, gCfg.transferMode, gCfg.allowOverwrite});
    LOG_F(INFO, "'%s' transferred to '%s' (%s)", source.c_str(),
      target.c_str(), MediaMover::toString(outcome.achieved));

    if(outcome.sourceRetained || outcome.backupRetained)
    {
      LOG_F(WARNING, "Transfer succeeded, but files were left behind");
      return PartialSuccess;
    }
  }
  catch(const MediaMover::TransferError &e)
  {
    LOG_F(ERROR, "%s", e.what());
    return exitCodeOf(e);
  }
  catch(const std::invalid_argument &e)
  {
    LOG_F(ERROR, "%s", e.what());
    return Usage;
  }

  return Success;
}
