#include <hfget/transfer/transfer-types.hxx>

#include <sstream>
#include <iomanip>

using namespace std;

namespace hfget
{
  transfer_event transfer_event::
  progress (uint64_t d, uint64_t t, string target)
  {
    transfer_event e;
    e.kind = kind_type::progress;
    e.state = transfer_state::transferring;
    e.downloaded = d;
    e.total = t;
    e.percent = percent_of (d, t);
    e.target = move (target);
    return e;
  }

  transfer_event transfer_event::
  status (transfer_state s, string m, string target)
  {
    transfer_event e;
    e.kind = kind_type::status;
    e.state = s;
    e.message = move (m);
    e.target = move (target);
    return e;
  }

  transfer_event transfer_event::
  finished (transfer_state s, string m)
  {
    transfer_event e;
    e.kind = kind_type::finished;
    e.state = s;
    e.message = move (m);
    return e;
  }

  string
  format_size (uint64_t n)
  {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};

    double v (static_cast<double> (n));
    const char* u ("PB");

    for (const char* x: units)
    {
      if (v < 1024.0)
      {
        u = x;
        break;
      }

      v /= 1024.0;
    }

    ostringstream o;
    o << fixed << setprecision (2) << v << ' ' << u;
    return o.str ();
  }
}
