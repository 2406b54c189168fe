#include <cassert>
#include <string>
#include <thread>
#include <vector>
#include <chrono>

#include <boost/asio.hpp>

#include <hfget/hfget-transfer.hxx>
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
  return t;
}

static void
test_file ()
{
  test_server srv;
  temp_dir tmp;

  string c (make_content (50000));

  test_server::route r;
  r.body = c;
  srv.add ("/f.bin", r);

  asio::io_context ioc;
  transfer_coordinator tc (ioc, http_client_traits<> (), fast_traits ());

  // Events are delivered on the controlling thread.
  //
  thread::id self (this_thread::get_id ());
  vector<transfer_event> es;

  tc.set_event_callback ([&es, self] (const transfer_event& e)
  {
    assert (this_thread::get_id () == self);
    es.push_back (e);
  });

  fs::path t (tmp.path () / "f.bin");

  transfer_state s (
    run_sync (ioc, tc.download_file (transfer_request (srv.url ("/f.bin"), t))));

  assert (s == transfer_state::completed);
  assert (read_file (t) == c);

  assert (!es.empty ());
  assert (es.back ().message == "done");

  // The finished marker itself is not passed on.
  //
  for (const transfer_event& e: es)
    assert (e.kind != transfer_event::kind_type::finished);
}

static void
test_batch ()
{
  test_server srv;
  temp_dir tmp;

  string a (make_content (3000));
  string b (make_content (4000));

  test_server::route r;
  r.body = a;
  srv.add ("/a.bin", r);
  r.body = b;
  srv.add ("/b.bin", r);

  asio::io_context ioc;
  transfer_coordinator tc (ioc, http_client_traits<> (), fast_traits ());

  vector<string> ms;
  tc.set_event_callback ([&ms] (const transfer_event& e)
  {
    if (!e.is_progress ())
      ms.push_back (e.message);
  });

  file_entries fes {{"a.bin", srv.url ("/a.bin"), a.size ()},
                    {"d/b.bin", srv.url ("/b.bin"), b.size ()},
                    {"c.bin", srv.url ("/c.bin"), 10}};

  transfer_state s (run_sync (ioc, tc.download_batch (fes, tmp.path ())));

  assert (s == transfer_state::failed);
  assert (read_file (tmp.path () / "a.bin") == a);
  assert (read_file (tmp.path () / "d" / "b.bin") == b);
  assert (ms.back () == "batch done: 2 downloaded, 0 skipped, 1 failed of 3");
}

static void
test_cancel ()
{
  test_server srv;
  temp_dir tmp;

  string c (make_content (1024 * 1024));

  test_server::route r;
  r.body = c;
  r.delay = chrono::milliseconds (2);
  srv.add ("/f.bin", r);

  asio::io_context ioc;
  transfer_coordinator tc (ioc, http_client_traits<> (), fast_traits ());

  tc.set_event_callback ([&tc] (const transfer_event& e)
  {
    if (e.is_progress ())
      tc.cancel ();
  });

  fs::path t (tmp.path () / "f.bin");

  transfer_state s (
    run_sync (ioc, tc.download_file (transfer_request (srv.url ("/f.bin"), t))));

  assert (s == transfer_state::cancelled);
  assert (fs::file_size (t) < c.size ());
}

static void
test_error ()
{
  asio::io_context ioc;
  transfer_coordinator tc (ioc, http_client_traits<> (), fast_traits ());

  vector<transfer_event> es;
  tc.set_event_callback ([&es] (const transfer_event& e) {es.push_back (e);});

  // The job throws on the worker and the reason is reported as a failure.
  //
  transfer_state s (
    run_sync (ioc, tc.download_file (transfer_request ("", "f.bin"))));

  assert (s == transfer_state::failed);
  assert (es.size () == 1);
  assert (es[0].state == transfer_state::failed);
  assert (es[0].message == "error: empty transfer URL");
}

int
main ()
{
  test_file ();
  test_batch ();
  test_cancel ();
  test_error ();
}
