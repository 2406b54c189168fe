#include <hfget/hub/hub-types.hxx>

using namespace std;

namespace hfget
{
  string
  to_string (repo_kind k)
  {
    switch (k)
    {
      case repo_kind::model:   return "model";
      case repo_kind::dataset: return "dataset";
    }
    return "model";
  }

  ostream&
  operator<< (ostream& o, const repo_coordinates& c)
  {
    if (c.kind == repo_kind::dataset)
      o << "datasets/";

    o << c.owner << '/' << c.name << '@' << c.branch;

    if (!c.subpath.empty ())
      o << ':' << c.subpath;

    return o;
  }
}
