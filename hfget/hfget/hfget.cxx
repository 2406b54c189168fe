#include <string>
#include <vector>
#include <variant>
#include <csignal>
#include <iostream>
#include <optional>
#include <exception>
#include <algorithm>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>

#include <hfget/version.hxx>
#include <hfget/hfget-options.hxx>
#include <hfget/hfget-progress.hxx>
#include <hfget/hfget-transfer.hxx>

#include <hfget/hub/hub-types.hxx>
#include <hfget/hub/hub-lister.hxx>
#include <hfget/hub/hub-endpoint.hxx>
#include <hfget/hub/hub-resolver.hxx>
#include <hfget/batch/batch-manifest.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace hfget
{
  // Prompt the user for a Yes/No answer.
  //
  // We strictly require a 'y' or 'n' (case-insensitive) to proceed. An EOF
  // on stdin is an error rather than an implied answer.
  //
  static bool
  confirm_action (const string& prompt)
  {
    string a;
    do
    {
      cout << prompt << " [y/n] " << flush;

      getline (cin, a);

      bool f (cin.fail ());
      bool e (cin.eof ());

      if (f || e)
        cout << endl;

      if (f)
        throw ios_base::failure ("unable to read y/n answer from stdin");

    } while (a != "y" && a != "Y" && a != "n" && a != "N");

    return a == "y" || a == "Y";
  }

  static int
  exit_code (transfer_state s)
  {
    switch (s)
    {
    case transfer_state::completed: return 0;
    case transfer_state::cancelled: return 2;
    default:                        return 1;
    }
  }

  // Everything derived from the command line.
  //
  struct runtime_context
  {
    optional<string>      url;
    fs::path              directory;
    hub_endpoint          endpoint;
    http_client_traits<>  http;
    transfer_traits       transfer;
    uint16_t              verbosity = 0;
    bool                  resume = false;
    bool                  assume_yes = false;
    bool                  keep_manifest = false;
  };

  class download_controller
  {
  public:
    download_controller (asio::io_context& ioc,
                         runtime_context ctx,
                         transfer_coordinator& tc)
      : ioc_ (ioc), ctx_ (move (ctx)), transfers_ (tc) {}

    asio::awaitable<int>
    run ()
    {
      const fs::path& d (ctx_.directory);

      if (ctx_.resume)
      {
        optional<batch_manifest> m (batch_manifest::load (d));

        if (!m)
        {
          cerr << "error: no interrupted batch in " << d << endl;
          co_return 1;
        }

        co_return co_await run_batch (*m);
      }

      optional<batch_manifest> im;
      try
      {
        im = batch_manifest::load (d);
      }
      catch (const exception& e)
      {
        cerr << "warning: ignoring " << batch_manifest::path (d) << ": "
             << e.what () << endl;
      }

      // Offer to finish an interrupted batch of a different URL first. For
      // the same URL we just go ahead: listing again and skipping complete
      // files gets us to the same place.
      //
      if (im && im->original_url != *ctx_.url)
      {
        file_entries p (im->pending ());

        if (!p.empty ())
        {
          cout << "interrupted download of " << im->original_url << " in "
               << d << " (" << p.size () << " of " << im->files.size ()
               << " files pending)" << endl;

          if (ctx_.assume_yes || confirm_action ("resume it?"))
            co_return co_await run_batch (*im);
        }
      }

      hub_resolver rs (ctx_.endpoint);
      hub_reference r (rs.resolve (*ctx_.url));

      if (const auto* f = get_if<single_file_ref> (&r))
      {
        if (ctx_.verbosity >= 1)
          cerr << "info: resolved to " << f->url << endl;

        cout << "downloading " << f->filename << " to " << d << endl;

        transfer_state s (
          co_await transfers_.download_file (
            transfer_request (f->url, d / f->filename)));

        co_return exit_code (s);
      }

      if (const auto* dr = get_if<directory_ref> (&r))
        co_return co_await run_directory (dr->repo);

      cerr << "error: unable to make sense of URL '" << *ctx_.url << "'"
           << endl;
      co_return 1;
    }

  private:
    asio::awaitable<int>
    run_directory (const repo_coordinates& c)
    {
      if (ctx_.verbosity >= 1)
        cerr << "info: resolved to " << c.kind << ' ' << c << endl;

      hub_lister l (ioc_, ctx_.endpoint, ctx_.http);

      optional<file_entries> files (co_await l.list_files (c));

      if (!files)
      {
        cerr << "error: unable to list " << c << ": " << l.last_error ()
             << endl;
        co_return 1;
      }

      if (files->empty ())
      {
        cerr << "warning: no files in " << c << endl;
        co_return 0;
      }

      cout << "found " << files->size () << " files in " << c << endl;

      batch_manifest m (move (*files), ctx_.directory.string (), *ctx_.url);
      m.save (ctx_.directory);

      co_return co_await run_batch (m);
    }

    // The files are saved relative to the directory the manifest is in,
    // which may have been moved since it was recorded.
    //
    asio::awaitable<int>
    run_batch (const batch_manifest& m)
    {
      const fs::path& d (ctx_.directory);

      transfer_state s (co_await transfers_.download_batch (m.files, d));

      if (s == transfer_state::completed && !ctx_.keep_manifest)
        batch_manifest::remove (d);

      co_return exit_code (s);
    }

  private:
    asio::io_context& ioc_;
    runtime_context ctx_;
    transfer_coordinator& transfers_;
  };
}

int
main (int argc, char* argv[])
{
  using namespace hfget;

  try
  {
    // Options and arguments can be interleaved.
    //
    cli::argv_scanner scan (argc, argv);

    options opt;
    vector<string> args;

    for (;;)
    {
      opt.parse (scan, cli::unknown_mode::fail, cli::unknown_mode::stop);

      if (!scan.more ())
        break;

      args.push_back (scan.next ());
    }

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "hfget " << HFGET_VERSION_ID << endl;
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: hfget [options] <url> [<dir>]" << "\n"
        << "       hfget [options] --resume [<dir>]" << "\n"
        << "options:" << "\n";

      opt.print_usage (o);

      return 0;
    }

    runtime_context ctx;
    ctx.resume = opt.resume ();

    size_t n (ctx.resume ? 0 : 1); // Number of leading non-directory args.

    if (args.size () < n)
    {
      cerr << "error: URL expected" << endl
           << "  info: run 'hfget --help' for more information" << endl;
      return 1;
    }

    if (args.size () > n + 1)
    {
      cerr << "error: unexpected argument '" << args[n + 1] << "'" << endl
           << "  info: run 'hfget --help' for more information" << endl;
      return 1;
    }

    if (!ctx.resume)
      ctx.url = args[0];

    ctx.directory = args.size () > n
      ? fs::path (args[n])
      : fs::path (opt.output ());

    ctx.endpoint = opt.endpoint_specified ()
      ? hub_endpoint (opt.endpoint ())
      : hub_endpoint::from_environment ();

    ctx.verbosity = opt.verbose_specified ()
      ? opt.verbose ()
      : opt.v () ? 1 : 0;

    ctx.assume_yes = opt.yes ();
    ctx.keep_manifest = opt.keep_manifest ();

    // Map the command line to the HTTP and transfer configuration.
    //
    auto& ht (ctx.http);
    ht.verify_ssl = !opt.no_verify_ssl ();
    ht.ssl_cert_file = opt.ca_file ();
    ht.verbosity = ctx.verbosity;

    if (opt.user_agent_specified ())
      ht.user_agent = opt.user_agent ();

    auto& tt (ctx.transfer);
    tt.max_attempts = max<uint32_t> (opt.retries (), 1);
    tt.retry_delay = opt.retry_delay () * 1000;
    tt.transfer_timeout = opt.timeout () * 1000;

    asio::io_context ioc;

    progress_coordinator pc (cout, cerr, ctx.verbosity, opt.quiet ());

    transfer_coordinator tc (ioc, ctx.http, ctx.transfer);
    tc.set_event_callback ([&pc] (const transfer_event& e) {pc.render (e);});

    // Signals are delivered to the controlling context and forwarded to the
    // running transfer as requests.
    //
    asio::signal_set sigs (ioc, SIGINT, SIGTERM);
#ifndef _WIN32
    sigs.add (SIGUSR1);
    sigs.add (SIGUSR2);
#endif

    function<void (const boost::system::error_code&, int)> on_signal;
    on_signal = [&] (const boost::system::error_code& ec, int s)
    {
      if (ec)
        return;

      switch (s)
      {
#ifndef _WIN32
      case SIGUSR1: tc.pause ();  break;
      case SIGUSR2: tc.resume (); break;
#endif
      default:
        {
          pc.finish_line ();
          cerr << "cancelling..." << endl;
          tc.cancel ();
          break;
        }
      }

      sigs.async_wait (on_signal);
    };

    sigs.async_wait (on_signal);

    int r (1);
    download_controller controller (ioc, move (ctx), tc);

    asio::co_spawn (
      ioc,
      controller.run (),
      [&r, &sigs, &pc] (exception_ptr ex, int v)
      {
        r = v;

        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            pc.finish_line ();
            cerr << "error: " << e.what () << endl;
            r = 1;
          }
        }

        sigs.cancel ();
      });

    ioc.run ();
    return r;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << endl;
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << endl;
    return 1;
  }
}
