#include <assist/progress/progress-tracker.hxx>
#include <assist/progress/progress-renderer.hxx>

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

using namespace std;
using namespace assist;

using traits = progress_tracker_traits<>;

static void
test_format ()
{
  assert (traits::format_bytes (0) == "0 B");
  assert (traits::format_bytes (1023) == "1023 B");
  assert (traits::format_bytes (1536) == "1.5 KiB");
  assert (traits::format_bytes (3 * 1024 * 1024) == "3.0 MiB");

  assert (traits::format_speed (500.0f) == "500 B/s");
  assert (traits::format_speed (2048.0f) == "2.0 KiB/s");

  assert (traits::format_duration (65) == "01m05s");
  assert (traits::format_duration (3723) == "1h02m03s");

  assert (traits::format_bar (0.5f, false, 10) == "[====>     ]");
  assert (traits::format_bar (1.0f, false, 4) == "[===>]");
  assert (traits::format_bar (0.0f, true, 6) == "[<==>  ]");
}

static void
test_snapshot ()
{
  progress_snapshot s;
  assert (s.progress_ratio () == 0.0f);
  assert (s.eta_seconds () == -1);

  s.current_bytes = 50;
  s.total_bytes = 100;
  s.speed = 10.0f;
  assert (s.progress_ratio () == 0.5f);
  assert (s.eta_seconds () == 5);

  // Unknown total.
  //
  progress_snapshot u;
  u.current_bytes = 10;
  assert (u.progress_ratio () == 0.0f);
  u.finished = true;
  assert (u.progress_ratio () == 1.0f);
}

static void
test_tracker ()
{
  progress_tracker t;

  // The first sample is always shown, the next one within the interval
  // is not.
  //
  assert (t.update (10, 100));
  assert (!t.update (20, 100));
  assert (t.snapshot ().current_bytes == 20);

  t.finish ();
  assert (t.snapshot ().current_bytes == 100);
  assert (t.snapshot ().progress_ratio () == 1.0f);

  t.reset ();
  assert (t.snapshot ().current_bytes == 0);
  assert (!t.snapshot ().finished);
}

static void
test_renderer ()
{
  ostringstream os;
  progress_renderer r (os);

  r.finish ();
  assert (os.str ().empty ());

  progress_snapshot s;
  s.current_bytes = 1024;
  s.total_bytes = 2048;

  r.show ("claude", s);
  assert (r.active ());
  assert (os.str ().find ("claude") != string::npos);
  assert (os.str ().find ("50%") != string::npos);

  r.finish ();
  assert (!r.active ());
  assert (os.str ().back () == '\n');
}

int
main ()
{
  test_format ();
  test_snapshot ();
  test_tracker ();
  test_renderer ();

  cout << "all progress tests passed" << endl;
  return 0;
}
