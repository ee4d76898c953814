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
#include "GreedyEngine.h"
#include "AtlasRegException.h"
#include "CommandLineHelper.h"
#include <itksys/Process.h>
#include <itksys/SystemTools.hxx>
#include <itkMacro.h>
#include <fstream>
#include <sstream>
#include <cstdio>

namespace atlasreg
{

static std::string read_text_file(const std::string &fn)
{
  std::ifstream fin(fn.c_str());
  std::ostringstream oss;
  if(fin.good())
    oss << fin.rdbuf();
  return oss.str();
}

template <typename TReal>
GreedyEngine<TReal>
::GreedyEngine(const EngineParameters &param, AtlasRegStdOut *out)
  : m_Param(param), m_PassCounter(0), m_StdOut(out ? out : &m_DefaultStdOut),
    m_DefaultStdOut(AtlasRegStdOut::VERB_NONE)
{
}

template <typename TReal>
std::string
GreedyEngine<TReal>
::CreatePassDirectory(const TransformTemplate &tmpl)
{
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "pass_%03d_", ++m_PassCounter);
  std::string dir = m_Param.work_directory + "/" + buffer + tmpl.name;
  if(!itksys::SystemTools::MakeDirectory(dir))
    throw AtlasRegException(AtlasRegException::RegistrationFailed,
                            "Unable to create engine directory %s", dir.c_str());
  return dir;
}

template <typename TReal>
std::vector<std::string>
GreedyEngine<TReal>
::BuildCommand(const TransformTemplate &tmpl,
               const std::string &fn_fixed,
               const std::string &fn_moving,
               const std::vector<std::string> &fn_initial,
               const std::string &fn_output,
               const std::string &fn_inverse,
               int threads)
{
  std::vector<std::string> args { "-d", "3" };

  if(tmpl.type == TransformTemplate::AFFINE)
    {
    args.push_back("-a");
    args.push_back("-dof");
    args.push_back(std::to_string(tmpl.dof));
    }

  // Metric, with the patch radius for the NCC metrics
  args.push_back("-m");
  args.push_back(tmpl.metric);
  if(tmpl.metric_radius.size() && (tmpl.metric == "NCC" || tmpl.metric == "WNCC"))
    {
    std::ostringstream oss;
    for(size_t i = 0; i < tmpl.metric_radius.size(); i++)
      oss << (i > 0 ? "x" : "") << tmpl.metric_radius[i];
    args.push_back(oss.str());
    }

  std::ostringstream iter;
  for(size_t i = 0; i < tmpl.iterations.size(); i++)
    iter << (i > 0 ? "x" : "") << tmpl.iterations[i];
  args.push_back("-n");
  args.push_back(iter.str());

  args.push_back("-i");
  args.push_back(fn_fixed);
  args.push_back(fn_moving);

  if(tmpl.type == TransformTemplate::AFFINE)
    {
    if(fn_initial.size())
      {
      args.push_back("-ia");
      args.push_back(fn_initial.front());
      }
    else
      {
      args.push_back("-ia-identity");
      }
    }
  else if(fn_initial.size())
    {
    args.push_back("-it");
    args.insert(args.end(), fn_initial.begin(), fn_initial.end());
    }

  args.push_back("-o");
  args.push_back(fn_output);

  if(fn_inverse.size())
    {
    args.push_back("-oinv");
    args.push_back(fn_inverse);
    }

  if(threads > 0)
    {
    args.push_back("-threads");
    args.push_back(std::to_string(threads));
    }

  std::vector<std::string> extra = SplitCommandLine(tmpl.options);
  args.insert(args.end(), extra.begin(), extra.end());

  return args;
}

template <typename TReal>
int
GreedyEngine<TReal>
::RunCommand(const std::vector<std::string> &args, const std::string &dir, std::string &log)
{
  std::vector<const char *> argv;
  for(const auto &a : args)
    argv.push_back(a.c_str());
  argv.push_back(nullptr);

  std::string fn_out = dir + "/engine_stdout.txt";
  std::string fn_err = dir + "/engine_stderr.txt";

  itksysProcess *proc = itksysProcess_New();
  if(!proc)
    {
    log += "Unable to allocate process\n";
    return -1;
    }

  itksysProcess_SetCommand(proc, argv.data());
  itksysProcess_SetWorkingDirectory(proc, dir.c_str());
  itksysProcess_SetPipeFile(proc, itksysProcess_Pipe_STDOUT, fn_out.c_str());
  itksysProcess_SetPipeFile(proc, itksysProcess_Pipe_STDERR, fn_err.c_str());

  // Blocks until the engine exits, there is no timeout
  itksysProcess_Execute(proc);
  itksysProcess_WaitForExit(proc, nullptr);

  int rc = -1;
  switch(itksysProcess_GetState(proc))
    {
    case itksysProcess_State_Exited:
      rc = itksysProcess_GetExitValue(proc);
      break;
    case itksysProcess_State_Error:
      log += std::string("Engine could not be run: ") + itksysProcess_GetErrorString(proc) + "\n";
      break;
    case itksysProcess_State_Exception:
      log += std::string("Engine terminated abnormally: ") + itksysProcess_GetExceptionString(proc) + "\n";
      break;
    default:
      log += "Engine ended in an unexpected state\n";
      break;
    }

  itksysProcess_Delete(proc);

  log += read_text_file(fn_out);
  log += read_text_file(fn_err);
  return rc;
}

template <typename TReal>
int
GreedyEngine<TReal>
::Register(TImage3D *fixed, TImage3D *moving,
           const TransformTemplate &tmpl,
           const std::vector<LegType> &initial,
           bool want_inverse,
           LegType &out_leg,
           std::string &log)
{
  typedef AtlasRegTools<TReal> Tools;

  if(tmpl.type == TransformTemplate::AFFINE
     && (initial.size() > 1 || (initial.size() == 1 && initial[0].kind != LegType::AFFINE)))
    {
    log += "An affine pass can only be seeded with a single affine transform\n";
    return 1;
    }

  std::string dir = CreatePassDirectory(tmpl);
  std::string fn_fixed = dir + "/fixed.nii.gz";
  std::string fn_moving = dir + "/moving.nii.gz";
  Tools::template WriteImage<TImage3D>(fixed, fn_fixed);
  Tools::template WriteImage<TImage3D>(moving, fn_moving);

  // Initial transforms, listed in the order the engine applies them
  std::vector<std::string> fn_initial;
  for(size_t i = initial.size(); i > 0; i--)
    {
    const LegType &leg = initial[i-1];
    char buffer[64];
    if(leg.kind == LegType::AFFINE)
      {
      snprintf(buffer, sizeof(buffer), "/init_%02d.mat", (int) (i-1));
      Tools::WriteAffineMatrix(leg.affine, dir + buffer);
      }
    else
      {
      snprintf(buffer, sizeof(buffer), "/init_%02d_warp.nii.gz", (int) (i-1));
      Tools::template WriteImage<TDisplacementField>(leg.warp, dir + buffer);
      }
    fn_initial.push_back(dir + buffer);
    }

  bool is_affine = tmpl.type == TransformTemplate::AFFINE;
  std::string fn_output = dir + (is_affine ? "/affine.mat" : "/warp.nii.gz");
  std::string fn_inverse = (!is_affine && want_inverse) ? dir + "/inverse_warp.nii.gz" : std::string();

  std::vector<std::string> args = BuildCommand(
        tmpl, fn_fixed, fn_moving, fn_initial, fn_output, fn_inverse, m_Param.threads);
  args.insert(args.begin(), m_Param.greedy_executable);

  std::ostringstream cmd;
  for(const auto &a : args)
    cmd << a << " ";
  m_StdOut->printf("-- [AtlasReg] engine: %s\n", cmd.str().c_str());
  log += "Command: " + cmd.str() + "\n";

  int rc = RunCommand(args, dir, log);
  if(rc != 0)
    {
    log += "Engine exited with code " + std::to_string(rc) + "\n";
    return rc;
    }

  if(!itksys::SystemTools::FileExists(fn_output.c_str())
     || (fn_inverse.size() && !itksys::SystemTools::FileExists(fn_inverse.c_str())))
    {
    log += "Engine did not produce the expected output in " + dir + "\n";
    return 2;
    }

  out_leg = LegType();
  out_leg.template_name = tmpl.name;
  out_leg.invertible = tmpl.invertible;
  try
    {
    if(is_affine)
      {
      out_leg.kind = LegType::AFFINE;
      out_leg.affine = Tools::ReadAffineMatrix(fn_output);
      }
    else
      {
      out_leg.kind = LegType::DEFORMABLE;
      out_leg.warp = Tools::ReadDisplacementField(fn_output);
      if(fn_inverse.size())
        out_leg.inverse_warp = Tools::ReadDisplacementField(fn_inverse);
      }
    }
  catch(std::exception &exc)
    {
    log += std::string("Unable to read engine output: ") + exc.what() + "\n";
    return 3;
    }

  return 0;
}

template class GreedyEngine<float>;
template class GreedyEngine<double>;

} // namespace atlasreg
