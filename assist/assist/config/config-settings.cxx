#include <assist/config/config-settings.hxx>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace assist
{
  namespace json = boost::json;

  json::object
  parse_settings (const string& text, const string& origin)
  {
    json::parse_options o;
    o.allow_comments = true;
    o.allow_trailing_commas = true;

    boost::system::error_code ec;
    json::value v (json::parse (text, ec, json::storage_ptr (), o));

    if (ec)
      throw runtime_error ("invalid JSON in " + origin + ": " + ec.message ());

    if (!v.is_object ())
      throw runtime_error (origin + " does not contain a JSON object");

    return move (v.as_object ());
  }

  json::object
  read_settings (const fs::path& p)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open " + p.string ());

    ostringstream os;
    os << ifs.rdbuf ();

    if (ifs.bad ())
      throw runtime_error ("unable to read " + p.string ());

    return parse_settings (os.str (), p.string ());
  }

  json::object
  merge_settings (json::object t, const json::object& s)
  {
    for (const auto& kv : s)
      t[kv.key ()] = kv.value ();

    return t;
  }

  static void
  format (ostream& o, const json::value& v, string& indent)
  {
    switch (v.kind ())
    {
    case json::kind::object:
      {
        const json::object& obj (v.get_object ());

        if (obj.empty ())
        {
          o << "{}";
          break;
        }

        o << "{\n";
        indent.append (2, ' ');

        for (auto i (obj.begin ()); i != obj.end (); ++i)
        {
          if (i != obj.begin ())
            o << ",\n";

          o << indent << json::serialize (json::value (i->key ())) << ": ";
          format (o, i->value (), indent);
        }

        indent.resize (indent.size () - 2);
        o << '\n' << indent << '}';
        break;
      }
    case json::kind::array:
      {
        const json::array& a (v.get_array ());

        if (a.empty ())
        {
          o << "[]";
          break;
        }

        o << "[\n";
        indent.append (2, ' ');

        for (auto i (a.begin ()); i != a.end (); ++i)
        {
          if (i != a.begin ())
            o << ",\n";

          o << indent;
          format (o, *i, indent);
        }

        indent.resize (indent.size () - 2);
        o << '\n' << indent << ']';
        break;
      }
    default:
      o << json::serialize (v);
    }
  }

  string
  format_settings (const json::value& v)
  {
    ostringstream o;
    string indent;
    format (o, v, indent);
    o << '\n';
    return o.str ();
  }

  void
  write_settings (const fs::path& p, const json::object& obj)
  {
    ofstream ofs (p, ios::binary | ios::trunc);
    if (!ofs)
      throw runtime_error ("unable to open " + p.string () + " for writing");

    ofs << format_settings (obj);

    if (!ofs.flush ())
      throw runtime_error ("unable to write " + p.string ());
  }

  string
  to_string (deploy_action a)
  {
    switch (a)
    {
      case deploy_action::copied:  return "deployed";
      case deploy_action::merged:  return "merged";
      case deploy_action::skipped: return "skipped";
    }
    return "unknown";
  }

  deploy_action
  deploy_settings (const fs::path& s, const fs::path& t)
  {
    error_code ec;

    if (!fs::exists (s, ec))
      return deploy_action::skipped;

    fs::create_directories (t.parent_path (), ec);
    if (ec)
      throw runtime_error ("unable to create " + t.parent_path ().string () +
                           ": " + ec.message ());

    if (!fs::exists (t, ec))
    {
      fs::copy_file (s, t, fs::copy_options::overwrite_existing, ec);

      if (ec)
        throw runtime_error ("unable to copy " + s.string () + " to " +
                             t.string () + ": " + ec.message ());

      return deploy_action::copied;
    }

    json::object src (read_settings (s));
    json::object dst (read_settings (t));

    write_settings (t, merge_settings (move (dst), src));
    return deploy_action::merged;
  }
}
