#include <assist/fetch/fetch-store.hxx>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace assist
{
  // remote_store
  //
  remote_store::
  remote_store (http_coordinator& h, string b)
    : http_ (h), base_ (move (b))
  {
    while (!base_.empty () && base_.back () == '/')
      base_.pop_back ();
  }

  string remote_store::
  url (const string& r) const
  {
    return base_ + '/' + r;
  }

  asio::awaitable<string> remote_store::
  fetch_text (const string& r)
  {
    co_return co_await http_.get (url (r));
  }

  asio::awaitable<void> remote_store::
  fetch_file (const string& r, const fs::path& t, progress_callback cb)
  {
    co_await http_.download_file (url (r), t, move (cb));
  }

  // local_store
  //
  local_store::
  local_store (fs::path r)
    : root_ (move (r))
  {
  }

  fs::path local_store::
  path (const string& r) const
  {
    return root_ / fs::path (r).make_preferred ();
  }

  bool local_store::
  contains (const string& r) const
  {
    error_code ec;
    return fs::is_regular_file (path (r), ec);
  }

  string local_store::
  read_text (const string& r) const
  {
    fs::path p (path (r));

    if (!contains (r))
      throw runtime_error (p.string () + " does not exist");

    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw runtime_error ("unable to open " + p.string ());

    ostringstream os;
    os << ifs.rdbuf ();

    if (ifs.bad ())
      throw runtime_error ("unable to read " + p.string ());

    return os.str ();
  }

  void local_store::
  copy_file (const string& r, const fs::path& t) const
  {
    fs::path p (path (r));

    if (!contains (r))
      throw runtime_error (p.string () + " does not exist");

    if (t.has_parent_path ())
    {
      error_code ec;
      fs::create_directories (t.parent_path (), ec);

      if (ec)
        throw runtime_error ("unable to create " +
                             t.parent_path ().string () + ": " +
                             ec.message ());
    }

    error_code ec;
    fs::copy_file (p, t, fs::copy_options::overwrite_existing, ec);

    if (ec)
      throw runtime_error ("unable to copy " + p.string () + " to " +
                           t.string () + ": " + ec.message ());
  }

  fs::path
  default_local_root (const fs::path& exe)
  {
    error_code ec;

    if (exe.has_parent_path ())
    {
      fs::path d (exe.parent_path () / "local");
      if (fs::is_directory (d, ec))
        return d;
    }

    fs::path c (fs::current_path (ec));
    return (ec ? fs::path (".") : c) / "local";
  }
}
