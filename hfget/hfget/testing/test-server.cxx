#include <hfget/testing/test-server.hxx>

#include <random>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

using namespace std;

namespace hfget
{
  namespace testing
  {
    namespace beast = boost::beast;
    namespace http = beast::http;

    using asio::ip::tcp;

    static const char*
    reason (uint16_t s)
    {
      switch (s)
      {
      case 200: return "OK";
      case 206: return "Partial Content";
      case 301: return "Moved Permanently";
      case 302: return "Found";
      case 303: return "See Other";
      case 307: return "Temporary Redirect";
      case 308: return "Permanent Redirect";
      case 404: return "Not Found";
      case 416: return "Range Not Satisfiable";
      case 500: return "Internal Server Error";
      case 503: return "Service Unavailable";
      default:  return "Unknown";
      }
    }

    // Parse "bytes=N-" returning N or -1 if it is not of this form.
    //
    static long long
    range_offset (const string& r)
    {
      if (r.compare (0, 6, "bytes=") != 0 || r.back () != '-')
        return -1;

      try
      {
        return stoll (r.substr (6, r.size () - 7));
      }
      catch (const exception&)
      {
        return -1;
      }
    }

    test_server::
    test_server ()
      : acceptor_ (ioc_, tcp::endpoint (asio::ip::make_address ("127.0.0.1"), 0)),
        port_ (acceptor_.local_endpoint ().port ()),
        thread_ ([this] {run ();})
    {
    }

    test_server::
    ~test_server ()
    {
      stop_ = true;

      // Wake up the blocking accept.
      //
      try
      {
        asio::io_context ioc;
        tcp::socket s (ioc);
        s.connect (tcp::endpoint (asio::ip::make_address ("127.0.0.1"), port_));
      }
      catch (const exception&)
      {
        // The acceptor is gone already.
      }

      thread_.join ();
    }

    void test_server::
    add (string target, route r)
    {
      lock_guard<mutex> l (mutex_);
      routes_[move (target)] = move (r);
    }

    string test_server::
    base () const
    {
      return "http://127.0.0.1:" + std::to_string (port_);
    }

    vector<test_server::record> test_server::
    requests () const
    {
      lock_guard<mutex> l (mutex_);
      return requests_;
    }

    size_t test_server::
    count (const string& method, const string& target) const
    {
      lock_guard<mutex> l (mutex_);

      size_t n (0);
      for (const record& r: requests_)
      {
        if (r.method == method && r.target == target)
          ++n;
      }
      return n;
    }

    void test_server::
    clear_requests ()
    {
      lock_guard<mutex> l (mutex_);
      requests_.clear ();
    }

    void test_server::
    run ()
    {
      while (!stop_)
      {
        tcp::socket s (ioc_);

        boost::system::error_code ec;
        acceptor_.accept (s, ec);

        if (ec || stop_)
          break;

        try
        {
          serve (s);
        }
        catch (const exception&)
        {
          // Client went away mid-exchange, which some tests do on purpose.
        }

        s.shutdown (tcp::socket::shutdown_both, ec);
        s.close (ec);
      }
    }

    void test_server::
    serve (tcp::socket& s)
    {
      beast::flat_buffer b;
      http::request<http::empty_body> rq;
      http::read (s, b, rq);

      record rec {string (rq.method_string ()),
                  string (rq.target ()),
                  string (rq[http::field::range])};

      // Look up the route and take what we need out of it (and account for
      // the drop) under the lock.
      //
      route r;
      bool found (false);
      bool drop (false);
      {
        lock_guard<mutex> l (mutex_);
        requests_.push_back (rec);

        auto i (routes_.find (rec.target));
        if (i != routes_.end ())
        {
          found = true;

          if (rec.method == "GET" && i->second.drops != 0)
          {
            --i->second.drops;
            drop = true;
          }

          r = i->second;
        }
      }

      bool head (rec.method == "HEAD");

      uint16_t status (404);
      string type ("text/plain");
      string body ("not found");
      string extra;

      if (found)
      {
        status = r.status;
        type = r.content_type;
        body = r.body;

        if (status >= 300 && status < 400 && !r.location.empty ())
          extra += "Location: " + r.location + "\r\n";

        if (status == 200 && r.ranges)
        {
          extra += "Accept-Ranges: bytes\r\n";

          if (!head && !rec.range.empty ())
          {
            long long o (range_offset (rec.range));

            if (o >= 0 && static_cast<size_t> (o) >= r.body.size ())
            {
              status = 416;
              extra += "Content-Range: bytes */" +
                std::to_string (r.body.size ()) + "\r\n";
              body.clear ();
            }
            else if (o >= 0)
            {
              status = 206;
              extra += "Content-Range: bytes " + std::to_string (o) + '-' +
                std::to_string (r.body.size () - 1) + '/' +
                std::to_string (r.body.size ()) + "\r\n";
              body = r.body.substr (static_cast<size_t> (o));
            }
          }
        }
      }

      ostringstream h;
      h << "HTTP/1.1 " << status << ' ' << reason (status) << "\r\n"
        << "Content-Type: " << type << "\r\n"
        << "Connection: close\r\n"
        << extra;

      if (!head || !found || r.head_length)
        h << "Content-Length: " << body.size () << "\r\n";

      h << "\r\n";

      asio::write (s, asio::buffer (h.str ()));

      if (head)
        return;

      // Write the body in pieces so that the delay applies between them.
      //
      size_t n (drop ? body.size () / 2 : body.size ());
      const size_t piece (8192);

      for (size_t p (0); p < n; p += piece)
      {
        if (p != 0 && found && r.delay.count () != 0)
          this_thread::sleep_for (r.delay);

        asio::write (s, asio::buffer (body.data () + p, min (piece, n - p)));
      }
    }

    string
    make_content (size_t size)
    {
      string r (size, '\0');

      mt19937 g (static_cast<uint32_t> (size));
      for (char& c: r)
        c = static_cast<char> ('a' + g () % 26);

      return r;
    }

    temp_dir::
    temp_dir ()
    {
      random_device rd;
      mt19937_64 g (rd ());

      for (;;)
      {
        fs::path p (fs::temp_directory_path () /
                    ("hfget-test-" + std::to_string (g () % 1000000000)));

        if (fs::create_directory (p))
        {
          path_ = move (p);
          break;
        }
      }
    }

    temp_dir::
    ~temp_dir ()
    {
      error_code ec;
      fs::remove_all (path_, ec);
    }

    string
    read_file (const fs::path& p)
    {
      ifstream ifs (p, ios::binary);

      if (!ifs)
        throw runtime_error ("unable to open " + p.string ());

      return string (istreambuf_iterator<char> (ifs),
                     istreambuf_iterator<char> ());
    }

    void
    write_file (const fs::path& p, const string& s)
    {
      if (p.has_parent_path ())
        fs::create_directories (p.parent_path ());

      ofstream ofs (p, ios::binary | ios::trunc);
      ofs.write (s.data (), static_cast<streamsize> (s.size ()));

      if (!ofs)
        throw runtime_error ("unable to write " + p.string ());
    }
  }
}
