#ifndef ATLASREGSTDOUT_H
#define ATLASREGSTDOUT_H

#include <cstdio>
#include <cstdarg>

namespace atlasreg
{

/** Verbosity-gated printf used for all orchestrator output */
class AtlasRegStdOut
{
public:
  enum Verbosity { VERB_NONE = 0, VERB_DEFAULT, VERB_VERBOSE, VERB_INVALID };

  AtlasRegStdOut(Verbosity verbosity = VERB_DEFAULT, FILE *f_out = NULL)
    : m_Verbosity(verbosity), m_Output(f_out ? f_out : stdout)
  {
  }

  void printf(const char *format, ...)
  {
    if(m_Verbosity > VERB_NONE)
      {
      va_list args;
      va_start(args, format);
      vfprintf(m_Output, format, args);
      va_end(args);
      }
  }

  void print_verbose(const char *format, ...)
  {
    if(m_Verbosity >= VERB_VERBOSE)
      {
      va_list args;
      va_start(args, format);
      vfprintf(m_Output, format, args);
      va_end(args);
      }
  }

  void flush()
  {
    fflush(m_Output);
  }

  Verbosity GetVerbosity() const { return m_Verbosity; }

private:
  Verbosity m_Verbosity;
  FILE *m_Output;
};

} // namespace atlasreg

#endif // ATLASREGSTDOUT_H
