#ifndef GATE_DIAL_LOCK_H
#define GATE_DIAL_LOCK_H

#if defined(ARDUINO)
#include <Arduino.h>
#else
#include <mutex>
#endif

namespace gate_dial {

#if defined(ARDUINO)
// Single core: callers reach the gate from loop() or an ISR, never a second thread.
class GateLock {
public:
  void lock() { noInterrupts(); }
  void unlock() { interrupts(); }
};
#else
typedef std::mutex GateLock;
#endif

class GateLockGuard {
public:
  explicit GateLockGuard(GateLock &lock) : _lock(lock) { _lock.lock(); }
  ~GateLockGuard() { _lock.unlock(); }

private:
  GateLock &_lock;
};

} // namespace gate_dial

#endif
