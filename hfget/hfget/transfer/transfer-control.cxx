#include <hfget/transfer/transfer-control.hxx>

using namespace std;

namespace hfget
{
  void transfer_control::
  cancel ()
  {
    cancel_.store (true);
    notify ();
  }

  void transfer_control::
  pause ()
  {
    pause_.store (true);
  }

  void transfer_control::
  resume ()
  {
    pause_.store (false);
    notify ();
  }

  void transfer_control::
  notify ()
  {
    shared_ptr<asio::steady_timer> t;
    {
      lock_guard<mutex> l (mutex_);
      t = waiter_;
    }

    // Timers are not thread-safe so cancel on the worker's own executor.
    //
    if (t != nullptr)
      asio::post (t->get_executor (), [t] () {t->cancel ();});
  }

  asio::awaitable<bool> transfer_control::
  wait_while_paused (chrono::milliseconds interval)
  {
    if (!pause_.load () || cancel_.load ())
      co_return !cancel_.load ();

    auto t (make_shared<asio::steady_timer> (co_await asio::this_coro::executor));
    publish (t);

    // Re-check after publishing the timer: a resume() or cancel() that came
    // in before would otherwise have nothing to wake up.
    //
    while (pause_.load () && !cancel_.load ())
    {
      t->expires_after (interval);

      boost::system::error_code ec;
      co_await t->async_wait (asio::redirect_error (asio::use_awaitable, ec));

      // operation_aborted is our wake-up call, anything else is just the
      // interval expiring.
    }

    publish (nullptr);
    co_return !cancel_.load ();
  }

  asio::awaitable<bool> transfer_control::
  wait_for (chrono::milliseconds d)
  {
    if (cancel_.load ())
      co_return false;

    auto t (make_shared<asio::steady_timer> (co_await asio::this_coro::executor));
    publish (t);

    // A resume() also wakes us up so keep waiting until the deadline.
    //
    auto e (chrono::steady_clock::now () + d);
    t->expires_at (e);

    while (!cancel_.load () && chrono::steady_clock::now () < e)
    {
      boost::system::error_code ec;
      co_await t->async_wait (asio::redirect_error (asio::use_awaitable, ec));
    }

    publish (nullptr);
    co_return !cancel_.load ();
  }

  void transfer_control::
  publish (shared_ptr<asio::steady_timer> t)
  {
    lock_guard<mutex> l (mutex_);
    waiter_ = move (t);
  }
}
