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
#ifndef GREEDYENGINE_H
#define GREEDYENGINE_H

#include "RegistrationEngine.h"
#include "AtlasRegParameters.h"
#include <string>
#include <vector>

namespace atlasreg
{

/**
 * Registration engine that runs the greedy executable. Each pass gets its own
 * directory under the work directory, holding the engine inputs, the output
 * transforms and the captured output of the engine.
 */
template <typename TReal>
class GreedyEngine : public RegistrationEngine<TReal>
{
public:
  ATLASREG_TYPEDEFS
  typedef TransformLeg<TReal> LegType;

  GreedyEngine(const EngineParameters &param, AtlasRegStdOut *out = nullptr);
  GreedyEngine(const GreedyEngine &) = delete;
  GreedyEngine &operator=(const GreedyEngine &) = delete;

  int Register(TImage3D *fixed, TImage3D *moving,
               const TransformTemplate &tmpl,
               const std::vector<LegType> &initial,
               bool want_inverse,
               LegType &out_leg,
               std::string &log) override;

  /** Command line of a pass, without the executable */
  static std::vector<std::string> BuildCommand(const TransformTemplate &tmpl,
                                               const std::string &fn_fixed,
                                               const std::string &fn_moving,
                                               const std::vector<std::string> &fn_initial,
                                               const std::string &fn_output,
                                               const std::string &fn_inverse,
                                               int threads);

protected:
  /** Run a command and wait for it, returns the exit code or -1 if it did not run */
  int RunCommand(const std::vector<std::string> &args, const std::string &dir, std::string &log);

  std::string CreatePassDirectory(const TransformTemplate &tmpl);

  EngineParameters m_Param;
  unsigned int m_PassCounter;
  AtlasRegStdOut *m_StdOut;
  AtlasRegStdOut m_DefaultStdOut;
};

} // namespace atlasreg

#endif // GREEDYENGINE_H
