/*=========================================================================

  Program:   AtlasReg atlas registration chain orchestrator
  Language:  C++

  AtlasReg is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  AtlasReg is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with AtlasReg.  If not, see <http://www.gnu.org/licenses/>.

=========================================================================*/
#ifndef COMMANDLINEHELPER_H
#define COMMANDLINEHELPER_H

#include "AtlasRegException.h"
#include <itksys/SystemTools.hxx>
#include <string>
#include <vector>
#include <cstdlib>

namespace atlasreg
{

/**
 * Split a string into a list of arguments with shell-style quoting, as
 * used for the engine options string in transform templates.
 */
std::vector<std::string> SplitCommandLine(const std::string &cmdline);

/**
 * Sequential reader over argc/argv. Each read_* method consumes one
 * argument and throws if it is missing or malformed.
 */
class CommandLineHelper
{
public:
  CommandLineHelper(int argc, char *argv[])
    : argc(argc), argv(argv), i(1)
  {
  }

  /** Set a root directory against which relative input filenames are resolved */
  void set_data_root(const char *root_path)
  {
    data_root = root_path;
  }

  /** Read a command (something that starts with a '-') */
  bool read_command(std::string &arg)
  {
    current_command.clear();
    if(i < argc)
      {
      current_command = arg = argv[i++];
      if(arg.size() == 0 || arg[0] != '-')
        throw AtlasRegException(AtlasRegException::InvalidSpec,
                                "Expected a command at position %d, instead got '%s'",
                                i - 1, arg.c_str());
      return true;
      }
    return false;
  }

  /** Read a raw argument, which may be anything */
  std::string read_arg()
  {
    if(i >= argc)
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "Unexpected end of command line arguments");
    return std::string(argv[i++]);
  }

  /** Read a string that is not a command (may not start with '-') */
  std::string read_string()
  {
    if(i >= argc || argv[i][0] == '-')
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "Expected a string argument as parameter to '%s'",
                              current_command.c_str());

    return std::string(argv[i++]);
  }

  /** Read an existing filename, resolved against the data root if one is set */
  std::string read_existing_filename()
  {
    std::string file = read_arg();
    if(data_root.size())
      file = itksys::SystemTools::CollapseFullPath(file, data_root);

    if(!itksys::SystemTools::FileExists(file.c_str()))
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "File '%s' does not exist", file.c_str());

    return file;
  }

  /** Read an output directory, creating it if needed */
  std::string read_output_dir()
  {
    std::string dir = read_arg();
    if(!itksys::SystemTools::MakeDirectory(dir))
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "Unable to create output directory '%s'", dir.c_str());
    return dir;
  }

  int read_integer()
  {
    if(i >= argc)
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "Expected an integer argument as parameter to '%s'",
                              current_command.c_str());

    char *end;
    long val = strtol(argv[i++], &end, 10);
    if(*end)
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "Expected an integer argument as parameter to '%s', instead got '%s'",
                              current_command.c_str(), argv[i-1]);

    return (int) val;
  }

private:
  int argc;
  char **argv;
  int i;
  std::string current_command;
  std::string data_root;
};

} // namespace atlasreg

#endif // COMMANDLINEHELPER_H
