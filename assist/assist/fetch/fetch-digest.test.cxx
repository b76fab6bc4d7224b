#include <assist/fetch/fetch-digest.hxx>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace std;
using namespace assist;

namespace fs = std::filesystem;

// Known answers from FIPS 180-2.
//
static void
test_string ()
{
  assert (sha256_string ("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert (sha256_string ("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// A file spanning several read buffers hashes the same as the string.
//
static void
test_file ()
{
  auto t (chrono::steady_clock::now ().time_since_epoch ().count ());
  fs::path p (fs::temp_directory_path () /
              ("assist-digest-" + std::to_string (t)));

  string s;
  for (size_t i (0); i < 200000; ++i)
    s += static_cast<char> ('a' + i % 26);

  {
    ofstream ofs (p, ios::binary);
    ofs << s;
  }

  assert (sha256_file (p) == sha256_string (s));

  fs::remove (p);

  try
  {
    sha256_file (p);
    assert (false);
  }
  catch (const runtime_error&)
  {
  }
}

static void
test_compare ()
{
  assert (compare_digests ("abcdef", "ABCDEF"));
  assert (compare_digests ("", ""));
  assert (!compare_digests ("abcdef", "abcde0"));
  assert (!compare_digests ("abc", "abcd"));
}

int
main ()
{
  test_string ();
  test_file ();
  test_compare ();

  cout << "all digest tests passed" << endl;
  return 0;
}
