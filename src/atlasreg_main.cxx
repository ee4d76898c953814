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

#include "AtlasRegAPI.h"
#include "CommandLineHelper.h"

#include <iostream>
#include <cstdio>

using namespace atlasreg;

int usage()
{
  printf("atlasreg: register a sample into an atlas through a chain of intermediate atlases\n");
  printf("Usage: \n");
  printf("  atlasreg -p <params.yaml> [options]\n");
  printf("Required options: \n");
  printf("  -p <params.yaml>       : Run document describing the sample, the atlases, the\n");
  printf("                           transform templates and the outputs\n");
  printf("Additional options: \n");
  printf("  -o <directory>         : Output directory, overrides output/directory\n");
  printf("  -greedy <executable>   : Registration engine executable (default: greedy)\n");
  printf("  -threads N             : Number of threads for the engine and for resampling\n");
  printf("  -dry-run               : Validate, print the chain and the working factors, and exit\n");
  printf("  -no-reuse              : Register every step even if saved transforms match\n");
  printf("  -float                 : Use single precision for images\n");
  printf("  -V <level>             : Verbosity (0: none, 1: default, 2: verbose)\n");
  return -1;
}

AtlasRegParameters parse_commandline(CommandLineHelper &cl)
{
  AtlasRegParameters param;
  std::string arg;
  while(cl.read_command(arg))
    {
    if(arg == "-p")
      {
      param.fn_parameters = cl.read_existing_filename();
      }
    else if(arg == "-o")
      {
      param.output_dir_override = cl.read_output_dir();
      }
    else if(arg == "-greedy")
      {
      param.greedy_executable_override = cl.read_string();
      }
    else if(arg == "-threads")
      {
      param.threads_override = cl.read_integer();
      }
    else if(arg == "-dry-run")
      {
      param.dry_run = true;
      }
    else if(arg == "-no-reuse")
      {
      param.no_reuse = true;
      }
    else if(arg == "-float")
      {
      param.flag_float_math = true;
      }
    else if(arg == "-V")
      {
      int level = cl.read_integer();
      if(level < 0 || level >= AtlasRegStdOut::VERB_INVALID)
        throw AtlasRegException(AtlasRegException::InvalidSpec, "Verbosity level %d is out of range", level);
      param.verbosity = (AtlasRegStdOut::Verbosity) level;
      }
    else
      {
      throw AtlasRegException(AtlasRegException::InvalidSpec, "Unknown parameter %s", arg.c_str());
      }
    }

  if(param.fn_parameters.empty())
    throw AtlasRegException(AtlasRegException::InvalidSpec, "Missing run document (-p)");

  return param;
}

int main(int argc, char *argv[])
{
  if(argc < 2)
    return usage();

  try
  {
    CommandLineHelper cl(argc, argv);
    AtlasRegParameters param = parse_commandline(cl);

    if(param.flag_float_math)
      return AtlasRegAPI<float>::Run(param);
    else
      return AtlasRegAPI<double>::Run(param);
  }
  catch(std::exception &exc)
  {
    std::cerr << "ABORTING PROGRAM DUE TO RUNTIME EXCEPTION -- "
              << exc.what() << std::endl;
    return -1;
  }
}
