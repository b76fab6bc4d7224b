#include <assist/tool/tool-registry.hxx>

#include <stdexcept>

using namespace std;

namespace assist
{
  tool& tool_registry::
  add (unique_ptr<tool> t)
  {
    string n (t->name ());

    auto r (tools_.emplace (n, move (t)));
    if (!r.second)
      throw invalid_argument ("tool " + n + " is already registered");

    return *r.first->second;
  }

  tool* tool_registry::
  find (const string& n) const noexcept
  {
    auto i (tools_.find (n));
    return i != tools_.end () ? i->second.get () : nullptr;
  }

  tool& tool_registry::
  get (const string& n) const
  {
    if (tool* t = find (n))
      return *t;

    string ks;
    for (const auto& p : tools_)
    {
      if (!ks.empty ())
        ks += ", ";

      ks += p.first;
    }

    throw runtime_error ("unknown tool '" + n + "' (available: " +
                         (ks.empty () ? string ("none") : ks) + ")");
  }

  vector<string> tool_registry::
  names () const
  {
    vector<string> r;
    r.reserve (tools_.size ());

    for (const auto& p : tools_)
      r.push_back (p.first);

    return r;
  }
}
