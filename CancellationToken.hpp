#ifndef __CANCELLATIONTOKEN_HPP__
#define __CANCELLATIONTOKEN_HPP__

#include <atomic>

namespace MediaMover
{
/**
 * @brief flag shared between a caller and a running transfer. It is only
 * polled between copy attempts and move steps, never in the middle of a
 * write. Safe to set from a signal handler.
 */
class CancellationToken
{
public:
  CancellationToken()
    : m_cancelled(false)
  {
  }
  CancellationToken(const CancellationToken &) = delete;

  void cancel() { m_cancelled = true; }
  void reset() { m_cancelled = false; }
  bool isCancelled() const { return m_cancelled; }

private:
  std::atomic<bool> m_cancelled;
};
}

#endif // !__CANCELLATIONTOKEN_HPP__
