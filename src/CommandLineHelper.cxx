#include "CommandLineHelper.h"
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <wordexp.h>
#endif

namespace atlasreg
{

std::vector<std::string> SplitCommandLine(const std::string &cmdline)
{
  std::vector<std::string> args;
  if(cmdline.empty())
    return args;

#ifndef _WIN32
  // No command substitution, report undefined variables
  wordexp_t p;
  int rc = wordexp(cmdline.c_str(), &p, WRDE_NOCMD | WRDE_UNDEF);
  if(rc != 0)
    {
    if(rc == WRDE_NOSPACE)
      wordfree(&p);
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Unable to split option string '%s'", cmdline.c_str());
    }

  for(size_t i = 0; i < p.we_wordc; i++)
    args.push_back(p.we_wordv[i]);

  wordfree(&p);
#else
  int argc = 0;
  size_t len = cmdline.size() + 1;
  std::vector<wchar_t> cmdlinew(len);
  if(!MultiByteToWideChar(CP_ACP, 0, cmdline.c_str(), -1, cmdlinew.data(), (int) len))
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Unable to split option string '%s'", cmdline.c_str());

  wchar_t **wargs = CommandLineToArgvW(cmdlinew.data(), &argc);
  if(!wargs)
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Unable to split option string '%s'", cmdline.c_str());

  // Convert from wchar_t * to ANSI char *
  for(int i = 0; i < argc; i++)
    {
    int needed = WideCharToMultiByte(CP_ACP, 0, wargs[i], -1, NULL, 0, NULL, NULL);
    std::vector<char> buffer(needed);
    WideCharToMultiByte(CP_ACP, 0, wargs[i], -1, buffer.data(), needed, NULL, NULL);
    args.push_back(buffer.data());
    }

  LocalFree(wargs);
#endif

  return args;
}

} // namespace atlasreg
