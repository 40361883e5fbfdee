#ifndef MOCKCHAIN_SERVICE_H
#define MOCKCHAIN_SERVICE_H

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace mc {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread or in the current thread when using run(). Derived classes must call
 * stop() from their own destructor, since runLoop() is gone by the time the
 * base destructor runs.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name);
  ~Service() override;

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  bool isStopSet() const { return isStopSet_; }
  bool isRunning() const { return isRunning_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Should check !isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   * Returning an error aborts the start.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the stop flag is set and before the thread is joined.
   * Override to unblock a runLoop() that waits on something other than the
   * stop flag.
   */
  virtual void onStopRequested() {}

  /**
   * Called after the thread has stopped (in the calling thread context).
   */
  virtual void onStop() {}

private:
  std::atomic<bool> isStopSet_{ true };
  std::atomic<bool> isRunning_{ false };
  std::thread thread_;
};

} // namespace mc

#endif // MOCKCHAIN_SERVICE_H
