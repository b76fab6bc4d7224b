namespace assist
{
  template <typename T>
  inline void basic_progress_tracker<T>::
  finish () noexcept
  {
    s_.finished = true;

    if (s_.total_bytes != 0)
      s_.current_bytes = s_.total_bytes;
  }

  template <typename T>
  inline void basic_progress_tracker<T>::
  reset () noexcept
  {
    *this = basic_progress_tracker ();
  }
}
