#pragma once

#include <mutex>
#include <atomic>
#include <memory>
#include <chrono>

#include <boost/asio.hpp>

namespace hfget
{
  namespace asio = boost::asio;

  // Cooperative pause/cancel signals of a running transfer (or batch).
  //
  // The controller calls cancel(), pause(), and resume() from any thread. The
  // worker checks the flags between chunks and suspends in
  // wait_while_paused(), which resume() and cancel() wake up promptly. A new
  // control object is used for every top-level transfer so the flags never
  // leak from one invocation into the next.
  //
  class transfer_control
  {
  public:
    transfer_control () = default;

    transfer_control (const transfer_control&) = delete;
    transfer_control& operator= (const transfer_control&) = delete;

    void
    cancel ();

    void
    pause ();

    void
    resume ();

    bool
    cancelled () const noexcept
    {
      return cancel_.load ();
    }

    bool
    paused () const noexcept
    {
      return pause_.load ();
    }

    // Suspend the calling coroutine while paused and not cancelled, waking
    // up at least every interval to re-check the flags. Return false if the
    // transfer has been cancelled.
    //
    asio::awaitable<bool>
    wait_while_paused (std::chrono::milliseconds interval);

    // Suspend the calling coroutine for the duration unless cancelled in the
    // meantime. Return false if the transfer has been cancelled.
    //
    asio::awaitable<bool>
    wait_for (std::chrono::milliseconds duration);

  private:
    void
    notify ();

    // Make the timer the one notify() wakes up, or clear it.
    //
    void
    publish (std::shared_ptr<asio::steady_timer>);

  private:
    std::atomic<bool> cancel_ {false};
    std::atomic<bool> pause_ {false};

    // Timer the worker is currently waiting on, if any. The mutex only
    // guards the pointer, never a wait.
    //
    std::mutex mutex_;
    std::shared_ptr<asio::steady_timer> waiter_;
  };

  using transfer_control_ptr = std::shared_ptr<transfer_control>;

  inline transfer_control_ptr
  make_transfer_control ()
  {
    return std::make_shared<transfer_control> ();
  }
}
