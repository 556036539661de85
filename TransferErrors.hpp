#ifndef __TRANSFERERRORS_HPP__
#define __TRANSFERERRORS_HPP__

#include <cstdint>
#include <string>
#include <stdexcept>

namespace MediaMover
{
class TransferError : public std::runtime_error
{
public:
  enum class Kind : int8_t
  {
    AlreadyExists = 1,
    UnsupportedOperation,
    IncompleteTransfer,
    IOFailure,
    Cancelled,
  };

  TransferError(Kind kind, const std::string &what)
    : std::runtime_error(what)
    , m_kind(kind){};

  Kind kind() const { return m_kind; }

private:
  Kind m_kind;
};

class AlreadyExistsError : public TransferError
{
public:
  AlreadyExistsError(const std::string &what)
    : TransferError(Kind::AlreadyExists, what){};
};

class UnsupportedOperationError : public TransferError
{
public:
  UnsupportedOperationError(const std::string &what)
    : TransferError(Kind::UnsupportedOperation, what){};
};

class IncompleteTransferError : public TransferError
{
public:
  IncompleteTransferError(const std::string &what)
    : TransferError(Kind::IncompleteTransfer, what){};
};

class IOError : public TransferError
{
public:
  IOError(const std::string &what)
    : TransferError(Kind::IOFailure, what){};
};

class CancelledError : public TransferError
{
public:
  CancelledError(const std::string &what)
    : TransferError(Kind::Cancelled, what){};
};
}

#endif // !__TRANSFERERRORS_HPP__
