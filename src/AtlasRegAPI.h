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
#ifndef ATLASREGAPI_H
#define ATLASREGAPI_H

#include "AtlasSpec.h"
#include "AtlasRegParameters.h"
#include "AtlasRegException.h"
#include "ChainResolver.h"
#include "ResolutionManager.h"
#include "RegistrationDriver.h"
#include "TransformComposer.h"
#include "ImageApplier.h"
#include "LandmarkIO.h"
#include "TransformIO.h"

namespace atlasreg
{

/**
 * Everything a run produced, including the partial results of a run that
 * stopped at a failing step.
 */
template <typename TReal>
struct AtlasRegOutput
{
  RegistrationChain chain;

  // Results of the steps that completed, in chain order
  std::vector<TransformResult<TReal> > results;

  // Index of the step that failed, -1 if none
  int failed_step = -1;

  // Failures that did not abort the run outright
  std::vector<AtlasRegException> errors;

  std::vector<ComposedTransform<TReal> > composed;
  std::vector<ImageRecord> images;
  LandmarkSets landmarks;

  const ComposedTransform<TReal> *GetComposed(ComposeDirection dir) const
  {
    for(const auto &ct : composed)
      if(ct.direction == dir)
        return &ct;
    return nullptr;
  }
};

/**
 * Runs the whole chain for one sample: validate, resolve, register every
 * step at its working resolution, compose the step transforms and apply
 * them to the sample's images (forward) and to the final atlas's images
 * (inverse).
 */
template <typename TReal>
class AtlasRegAPI
{
public:
  ATLASREG_TYPEDEFS
  typedef AtlasRegOutput<TReal> OutputType;
  typedef TransformComposer<TReal> ComposerType;
  typedef ComposedTransform<TReal> ComposedType;

  AtlasRegAPI(const AtlasRegConfiguration &config, RegistrationEngine<TReal> *engine,
              AtlasRegStdOut *out = nullptr);
  AtlasRegAPI(const AtlasRegAPI &) = delete;
  AtlasRegAPI &operator=(const AtlasRegAPI &) = delete;

  /** Run all stages. Returns 0 if every requested output was produced */
  int Run();

  /** Validate, resolve and print the working factors of each step */
  int DryRun();

  const OutputType &GetOutput() const { return m_Output; }

  /** Command line entry point: load the document, apply overrides and run with greedy */
  static int Run(const AtlasRegParameters &param);

protected:
  void ConfigThreads();

  bool RunSteps(WorkingImageCache<TReal> &cache, TransformIO<TReal> &tio);

  void ApplyForward(const ComposedType &ct);
  void ApplyInverse(const ComposedType &ct);

  std::string GetOutputFilename(const std::string &subdir, const std::string &prefix,
                                const std::string &input) const;

  std::string GetTreeOutputFilename(const std::string &subdir, const std::string &prefix,
                                    const std::string &tree) const;

  void CopyStructureTrees(const AtlasSpec &spec, const std::string &subdir, const std::string &prefix);

  /** Describe the registered sample as an atlas whose annotations include the final atlas's */
  void WriteTargetParameters();

  void WriteLandmarks(const std::string &set, const std::string &subdir, const std::string &prefix,
                      const std::vector<ReferencePoint> &points, const ImageGeometry &grid);

private:
  AtlasRegConfiguration m_Config;
  RegistrationEngine<TReal> *m_Engine;

  OutputType m_Output;

  AtlasRegStdOut *m_StdOut;
  AtlasRegStdOut m_DefaultStdOut;
};

} // namespace atlasreg

#endif // ATLASREGAPI_H
