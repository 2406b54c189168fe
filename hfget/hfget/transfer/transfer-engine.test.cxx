#include <cassert>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <stdexcept>

#include <boost/asio.hpp>

#include <hfget/transfer/transfer-types.hxx>
#include <hfget/transfer/transfer-engine.hxx>
#include <hfget/transfer/transfer-events.hxx>
#include <hfget/transfer/transfer-control.hxx>
#include <hfget/testing/test-server.hxx>

using namespace std;
using namespace hfget;
using namespace hfget::testing;

static transfer_traits
fast_traits ()
{
  transfer_traits t;
  t.retry_delay = 50;
  t.pause_interval = 20;
  t.probe_timeout = 2000;
  t.transfer_timeout = 5000;
  return t;
}

static transfer_event_handler
recorder (vector<transfer_event>& es)
{
  return [&es] (transfer_event e) -> asio::awaitable<void>
  {
    es.push_back (move (e));
    co_return;
  };
}

// Return the index of the first status event containing the text or -1.
//
static long
find_status (const vector<transfer_event>& es, const string& s)
{
  for (size_t i (0); i != es.size (); ++i)
  {
    if (!es[i].is_progress () && es[i].message.find (s) != string::npos)
      return static_cast<long> (i);
  }
  return -1;
}

static size_t
gets (const test_server& srv, const string& target)
{
  return srv.count ("GET", target);
}

static void
test_fresh_and_repeat ()
{
  test_server srv;
  temp_dir tmp;

  string c (make_content (100000));

  test_server::route r;
  r.body = c;
  srv.add ("/f.bin", r);

  asio::io_context ioc;
  transfer_engine e (ioc, http_client_traits<> (), fast_traits ());

  fs::path t (tmp.path () / "sub" / "f.bin");

  {
    vector<transfer_event> es;
    transfer_result res (
      run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"), t),
                                 nullptr,
                                 recorder (es))));

    assert (res.success ());
    assert (res.bytes == c.size () && res.total == c.size ());
    assert (read_file (t) == c);
    assert (gets (srv, "/f.bin") == 1);

    // Probe first, progress is monotonic and ends at 100%.
    //
    assert (find_status (es, "probing") == 0);

    uint64_t last (0);
    for (const transfer_event& x: es)
    {
      if (x.is_progress ())
      {
        assert (x.downloaded >= last);
        assert (x.total == c.size ());
        last = x.downloaded;
      }
    }
    assert (last == c.size ());

    assert (es.back ().state == transfer_state::completed);
    assert (es.back ().message == "done");
  }

  // Nothing is fetched the second time around.
  //
  {
    srv.clear_requests ();

    vector<transfer_event> es;
    transfer_result res (
      run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"), t),
                                 nullptr,
                                 recorder (es))));

    assert (res.success ());
    assert (res.message == "file exists");
    assert (gets (srv, "/f.bin") == 0);
    assert (srv.count ("HEAD", "/f.bin") == 1);
    assert (read_file (t) == c);

    assert (find_status (es, "file exists") != -1);
  }
}

static void
test_resume ()
{
  test_server srv;
  temp_dir tmp;

  string c (make_content (70000));

  test_server::route r;
  r.body = c;
  srv.add ("/f.bin", r);

  fs::path t (tmp.path () / "f.bin");
  write_file (t, c.substr (0, 12345));

  asio::io_context ioc;
  transfer_engine e (ioc, http_client_traits<> (), fast_traits ());

  vector<transfer_event> es;
  transfer_result res (
    run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"), t),
                               nullptr,
                               recorder (es))));

  assert (res.success ());
  assert (read_file (t) == c);

  vector<test_server::record> rs (srv.requests ());
  assert (rs.size () == 2);
  assert (rs[0].method == "HEAD");
  assert (rs[1].method == "GET" && rs[1].range == "bytes=12345-");

  assert (find_status (es, "resuming from") != -1);

  // The first progress event already accounts for the existing bytes.
  //
  for (const transfer_event& x: es)
  {
    if (x.is_progress ())
    {
      assert (x.downloaded > 12345);
      break;
    }
  }
}

static void
test_range_ignored ()
{
  test_server srv;
  temp_dir tmp;

  string c (make_content (30000));

  test_server::route r;
  r.body = c;
  r.ranges = false;
  srv.add ("/f.bin", r);

  fs::path t (tmp.path () / "f.bin");
  write_file (t, string (1000, 'x')); // Stale garbage.

  asio::io_context ioc;
  transfer_engine e (ioc, http_client_traits<> (), fast_traits ());

  vector<transfer_event> es;
  transfer_result res (
    run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"), t),
                               nullptr,
                               recorder (es))));

  assert (res.success ());
  assert (read_file (t) == c);
  assert (find_status (es, "range not honored") != -1);

  vector<test_server::record> rs (srv.requests ());
  assert (rs.size () == 3);
  assert (rs[1].range == "bytes=1000-");
  assert (rs[2].range.empty ());
}

static void
test_http_error ()
{
  test_server srv;
  temp_dir tmp;

  asio::io_context ioc;
  transfer_engine e (ioc, http_client_traits<> (), fast_traits ());

  fs::path t (tmp.path () / "missing.bin");

  transfer_result res (
    run_sync (ioc, e.transfer (transfer_request (srv.url ("/missing.bin"),
                                                 t))));

  assert (res.state == transfer_state::failed);
  assert (res.message == "HTTP 404 Not Found");

  // Not retried.
  //
  assert (gets (srv, "/missing.bin") == 1);
}

static void
test_drops ()
{
  string c (make_content (100000));

  // Recovers after two interrupted responses, continuing each time from
  // what made it to disk.
  //
  {
    test_server srv;
    temp_dir tmp;

    test_server::route r;
    r.body = c;
    r.drops = 2;
    srv.add ("/f.bin", r);

    asio::io_context ioc;
    transfer_engine e (ioc, http_client_traits<> (), fast_traits ());

    fs::path t (tmp.path () / "f.bin");

    vector<transfer_event> es;
    transfer_result res (
      run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"), t),
                                 nullptr,
                                 recorder (es))));

    assert (res.success ());
    assert (read_file (t) == c);
    assert (gets (srv, "/f.bin") == 3);

    vector<test_server::record> rs (srv.requests ());
    assert (rs.back ().range == "bytes=75000-");

    assert (find_status (es, "retrying (attempt 2 of 3)") != -1);
    assert (find_status (es, "retrying (attempt 3 of 3)") != -1);
  }

  // Gives up after the configured number of attempts.
  //
  {
    test_server srv;
    temp_dir tmp;

    test_server::route r;
    r.body = c;
    r.drops = 100;
    srv.add ("/f.bin", r);

    asio::io_context ioc;
    transfer_engine e (ioc, http_client_traits<> (), fast_traits ());

    fs::path t (tmp.path () / "f.bin");

    transfer_result res (
      run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"), t))));

    assert (res.state == transfer_state::failed);
    assert (res.message.find ("failed after 3 attempts") == 0);
    assert (gets (srv, "/f.bin") == 3);

    // The partial data stays for a later resume.
    //
    assert (res.bytes > 0 && res.bytes < c.size ());
    assert (fs::file_size (t) == res.bytes);
  }
}

static void
test_cancel ()
{
  test_server srv;
  temp_dir tmp;

  string c (make_content (1024 * 1024));

  test_server::route r;
  r.body = c;
  r.delay = chrono::milliseconds (1);
  srv.add ("/f.bin", r);

  asio::io_context ioc;
  transfer_engine e (ioc, http_client_traits<> (), fast_traits ());

  fs::path t (tmp.path () / "f.bin");
  transfer_control_ptr ctl (make_transfer_control ());

  vector<string> ss;
  transfer_event_handler h (
    make_callback_handler (
      [&ctl] (double, uint64_t d, uint64_t)
      {
        if (d >= 64 * 1024)
          ctl->cancel ();
      },
      [&ss] (const string& m) {ss.push_back (m);}));

  transfer_result res (
    run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"), t),
                               ctl,
                               h)));

  assert (res.state == transfer_state::cancelled);
  assert (ss.back () == "cancelled");

  // What was written is kept and is a prefix of the content.
  //
  string p (read_file (t));
  assert (p.size () == res.bytes);
  assert (p.size () >= 64 * 1024 && p.size () < c.size ());
  assert (c.compare (0, p.size (), p) == 0);
}

static void
test_cancel_backoff ()
{
  test_server srv;
  temp_dir tmp;

  test_server::route r;
  r.body = make_content (20000);
  r.drops = 100;
  srv.add ("/f.bin", r);

  transfer_traits tt (fast_traits ());
  tt.retry_delay = 10000;

  asio::io_context ioc;
  transfer_engine e (ioc, http_client_traits<> (), tt);

  transfer_control_ptr ctl (make_transfer_control ());

  // Cancel as soon as the engine announces the retry.
  //
  vector<string> ss;
  transfer_event_handler h (
    make_callback_handler (
      nullptr,
      [&ctl, &ss] (const string& m)
      {
        ss.push_back (m);

        if (m.find ("retrying") == 0)
          ctl->cancel ();
      }));

  auto s (chrono::steady_clock::now ());

  transfer_result res (
    run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"),
                                                 tmp.path () / "f.bin"),
                               ctl,
                               h)));

  assert (res.state == transfer_state::cancelled);
  assert (chrono::steady_clock::now () - s < chrono::seconds (5));
  assert (gets (srv, "/f.bin") == 1);
  assert (ss.back () == "cancelled");
}

static void
test_pause ()
{
  test_server srv;
  temp_dir tmp;

  string c (make_content (50000));

  test_server::route r;
  r.body = c;
  srv.add ("/f.bin", r);

  asio::io_context ioc;
  transfer_engine e (ioc, http_client_traits<> (), fast_traits ());

  fs::path t (tmp.path () / "f.bin");

  transfer_control_ptr ctl (make_transfer_control ());
  ctl->pause ();

  asio::steady_timer tm (ioc, chrono::milliseconds (150));
  tm.async_wait ([&ctl] (const boost::system::error_code&) {ctl->resume ();});

  vector<transfer_event> es;
  transfer_result res (
    run_sync (ioc, e.transfer (transfer_request (srv.url ("/f.bin"), t),
                               ctl,
                               recorder (es))));

  assert (res.success ());
  assert (read_file (t) == c);

  long p (find_status (es, "paused"));
  long u (find_status (es, "resumed"));

  assert (p != -1 && u != -1 && p < u);
  assert (es[p].state == transfer_state::paused);

  // No bytes were moved while paused.
  //
  for (long i (0); i != u; ++i)
    assert (!es[i].is_progress ());
}

static void
test_invalid ()
{
  asio::io_context ioc;
  transfer_engine e (ioc);

  bool thrown (false);
  try
  {
    run_sync (ioc, e.transfer (transfer_request ("", "f.bin")));
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }
  assert (thrown);
}

int
main ()
{
  test_fresh_and_repeat ();
  test_resume ();
  test_range_ignored ();
  test_http_error ();
  test_drops ();
  test_cancel ();
  test_cancel_backoff ();
  test_pause ();
  test_invalid ();
}
