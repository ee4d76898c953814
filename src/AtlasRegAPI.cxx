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
#include "GreedyEngine.h"
#include "TransformIO.h"
#include "ImageFilterPipeline.h"

#include <itkMultiThreaderBase.h>
#include <itksys/SystemTools.hxx>
#include <cstdio>

namespace atlasreg
{

// File name without directory and without its (possibly double) extension
static std::string get_stem(const std::string &fn)
{
  std::string name = itksys::SystemTools::GetFilenameName(fn);
  if(name.size() > 3 && name.compare(name.size() - 3, 3, ".gz") == 0)
    name = name.substr(0, name.size() - 3);
  return itksys::SystemTools::GetFilenameWithoutLastExtension(name);
}

template <typename TReal>
AtlasRegAPI<TReal>
::AtlasRegAPI(const AtlasRegConfiguration &config, RegistrationEngine<TReal> *engine, AtlasRegStdOut *out)
  : m_Config(config), m_Engine(engine)
{
  m_StdOut = out ? out : &m_DefaultStdOut;
}

template <typename TReal>
void
AtlasRegAPI<TReal>
::ConfigThreads()
{
  int threads = m_Config.engine.threads;
  if(threads > 0)
    {
    m_StdOut->printf("-- [AtlasReg] limiting the number of threads to %d\n", threads);
    itk::MultiThreaderBase::SetGlobalMaximumNumberOfThreads(threads);
    itk::MultiThreaderBase::SetGlobalDefaultNumberOfThreads(threads);
    }
  else
    {
    m_StdOut->print_verbose("-- [AtlasReg] executing with the default number of threads: %d\n",
                            itk::MultiThreaderBase::GetGlobalDefaultNumberOfThreads());
    }
}

template <typename TReal>
std::string
AtlasRegAPI<TReal>
::GetOutputFilename(const std::string &subdir, const std::string &prefix, const std::string &input) const
{
  const OutputParameters &op = m_Config.output;
  return op.directory + "/" + subdir + "/" + prefix + get_stem(input) + "." + op.save_image_type;
}

template <typename TReal>
std::string
AtlasRegAPI<TReal>
::GetTreeOutputFilename(const std::string &subdir, const std::string &prefix, const std::string &tree) const
{
  return m_Config.output.directory + "/" + subdir + "/" + prefix + itksys::SystemTools::GetFilenameName(tree);
}

template <typename TReal>
void
AtlasRegAPI<TReal>
::CopyStructureTrees(const AtlasSpec &spec, const std::string &subdir, const std::string &prefix)
{
  for(const auto &tree : spec.structure_tree_paths)
    {
    std::string fn_out = GetTreeOutputFilename(subdir, prefix, tree);
    if(!itksys::SystemTools::CopyFileAlways(tree, fn_out))
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "Unable to copy structure tree %s to %s", tree.c_str(), fn_out.c_str())
          .SetSpec(spec.id);
    }
}

template <typename TReal>
void
AtlasRegAPI<TReal>
::WriteLandmarks(const std::string &set, const std::string &subdir, const std::string &prefix,
                 const std::vector<ReferencePoint> &points, const ImageGeometry &grid)
{
  std::string fn = m_Config.output.directory + "/" + subdir + "/" + prefix + "reference_points.vtk";
  atlasreg::WriteLandmarks(points, grid, fn.c_str());
  m_Output.landmarks[set] = points;
  m_StdOut->printf("-- [AtlasReg] %d reference point(s) written to %s\n", (int) points.size(), fn.c_str());
}

template <typename TReal>
bool
AtlasRegAPI<TReal>
::RunSteps(WorkingImageCache<TReal> &cache, TransformIO<TReal> &tio)
{
  const OutputParameters &op = m_Config.output;
  ResolutionManager<TReal> rm(&cache, op.downsample_tolerance, m_StdOut);
  RegistrationDriver<TReal> driver(m_Engine, m_StdOut);

  for(const auto &step : m_Output.chain)
    {
    try
      {
      m_StdOut->printf("-- [AtlasReg] step %d: preparing %s -> %s\n",
                       step.index, step.moving.id.c_str(), step.fixed.id.c_str());

      WorkingImages<TReal> wi = rm.Prepare(step);
      typename TImage3D::Pointer fixed = wi.fixed, moving = wi.moving;

      // Prefilters affect registration only, never the outputs
      if(step.fixed.prefilter.size())
        {
        m_StdOut->printf("-- [AtlasReg] step %d: prefilter '%s' on %s\n",
                         step.index, step.fixed.prefilter.c_str(), step.fixed.id.c_str());
        fixed = ImageFilterPipeline<TReal>(step.fixed.prefilter).Apply(fixed);
        }
      if(step.moving.prefilter.size())
        {
        m_StdOut->printf("-- [AtlasReg] step %d: prefilter '%s' on %s\n",
                         step.index, step.moving.prefilter.c_str(), step.moving.id.c_str());
        moving = ImageFilterPipeline<TReal>(step.moving.prefilter).Apply(moving);
        }

      if(op.save_working_images)
        {
        std::string dir = op.directory + "/working";
        if(!itksys::SystemTools::MakeDirectory(dir))
          throw AtlasRegException(AtlasRegException::InvalidSpec, "Unable to create directory %s", dir.c_str());
        char buffer[64];
        snprintf(buffer, sizeof(buffer), "step_%02d_", step.index);
        AtlasRegTools<TReal>::template WriteImage<TImage3D>(
              fixed, dir + "/" + buffer + "fixed_" + step.fixed.id + "." + op.save_image_type);
        AtlasRegTools<TReal>::template WriteImage<TImage3D>(
              moving, dir + "/" + buffer + "moving_" + step.moving.id + "." + op.save_image_type);
        }

      TransformResult<TReal> result;
      ImageGeometry gf = ImageGeometry::FromImage(fixed.GetPointer());
      ImageGeometry gm = ImageGeometry::FromImage(moving.GetPointer());
      if(!op.reuse_transforms || !tio.Load(step, gf, gm, op.downsample_tolerance, result))
        {
        result = driver.Run(step, fixed, moving);
        result.scale_fixed = wi.scale_fixed;
        result.scale_moving = wi.scale_moving;

        std::vector<std::string> names;
        for(const auto &tmpl : step.templates)
          names.push_back(tmpl.name);
        tio.Save(result, names);
        }

      m_Output.results.push_back(result);
      }
    catch(AtlasRegException &exc)
      {
      if(exc.GetStep() < 0)
        exc.SetStep(step.index).SetSpec(step.moving.id, step.fixed.id);
      m_Output.failed_step = (int) step.index;
      m_Output.errors.push_back(exc);
      m_StdOut->printf("-- [AtlasReg] step %d failed, results of %d earlier step(s) remain in %s\n%s\n",
                       step.index, (int) m_Output.results.size(), tio.GetDirectory().c_str(), exc.what());
      return false;
      }
    catch(std::exception &exc)
      {
      // ITK and file system errors, e.g. an unreadable template
      AtlasRegException err(AtlasRegException::RegistrationFailed, "step %d could not be completed", step.index);
      err.SetStep(step.index).SetSpec(step.moving.id, step.fixed.id).SetCause(exc.what());
      m_Output.failed_step = (int) step.index;
      m_Output.errors.push_back(err);
      m_StdOut->printf("-- [AtlasReg] step %d failed, results of %d earlier step(s) remain in %s\n%s\n",
                       step.index, (int) m_Output.results.size(), tio.GetDirectory().c_str(), err.what());
      return false;
      }
    }

  return true;
}

template <typename TReal>
void
AtlasRegAPI<TReal>
::ApplyForward(const ComposedType &ct)
{
  const AtlasSpec &source = m_Output.chain.GetSource();
  const std::string &prefix = m_Config.output.source_to_target_prefix;
  const DirectionOutputs &sel = m_Config.output.source_to_target;
  const char *subdir = "source-to-target";

  std::vector<ImageJob> jobs;
  if(sel.save_template)
    jobs.push_back({ source.template_path, GetOutputFilename(subdir, prefix, source.template_path), IMAGE_INTENSITY });
  if(sel.save_images)
    for(const auto &fn : m_Config.sample.image_paths)
      jobs.push_back({ fn, GetOutputFilename(subdir, prefix, fn), IMAGE_INTENSITY });
  if(sel.save_annotations)
    for(const auto &fn : source.annotation_paths)
      jobs.push_back({ fn, GetOutputFilename(subdir, prefix, fn), IMAGE_LABEL });

  ImageApplier<TReal> applier(m_Engine, m_Config.output.intensity_interpolation,
                              m_Config.output.downsample_tolerance, m_StdOut);
  std::vector<ImageRecord> records = applier.ApplyAll(ct, jobs);
  m_Output.images.insert(m_Output.images.end(), records.begin(), records.end());

  if(sel.save_annotations)
    CopyStructureTrees(source, subdir, prefix);

  // Sample landmarks go to atlas pixels through the inverse point map
  const ComposedType *inv = m_Output.GetComposed(COMPOSE_INVERSE);
  if(source.reference_points.size())
    {
    if(inv)
      this->WriteLandmarks(subdir, subdir, prefix, applier.MapPoints(*inv, source.reference_points), inv->source);
    else
      m_StdOut->printf("-- [AtlasReg] sample reference points not mapped, the chain has no inverse\n");
    }
}

template <typename TReal>
void
AtlasRegAPI<TReal>
::ApplyInverse(const ComposedType &ct)
{
  const AtlasSpec &target = m_Output.chain.GetFinalTarget();
  const std::string &prefix = m_Config.output.target_to_source_prefix;
  const DirectionOutputs &sel = m_Config.output.target_to_source;
  const char *subdir = "target-to-source";

  // The final atlas has no channel images, its template is its only intensity image
  std::vector<ImageJob> jobs;
  if(sel.save_template)
    jobs.push_back({ target.template_path, GetOutputFilename(subdir, prefix, target.template_path), IMAGE_INTENSITY });
  if(sel.save_annotations)
    for(const auto &fn : target.annotation_paths)
      jobs.push_back({ fn, GetOutputFilename(subdir, prefix, fn), IMAGE_LABEL });

  ImageApplier<TReal> applier(m_Engine, m_Config.output.intensity_interpolation,
                              m_Config.output.downsample_tolerance, m_StdOut);
  std::vector<ImageRecord> records = applier.ApplyAll(ct, jobs);
  m_Output.images.insert(m_Output.images.end(), records.begin(), records.end());

  if(sel.save_annotations)
    CopyStructureTrees(target, subdir, prefix);

  // Atlas landmarks go to sample pixels through the forward point map
  const ComposedType *fwd = m_Output.GetComposed(COMPOSE_FORWARD);
  if(target.reference_points.size() && fwd)
    this->WriteLandmarks(subdir, subdir, prefix, applier.MapPoints(*fwd, target.reference_points), fwd->source);
}

template <typename TReal>
void
AtlasRegAPI<TReal>
::WriteTargetParameters()
{
  const OutputParameters &op = m_Config.output;
  const AtlasSpec &source = m_Output.chain.GetSource();
  const AtlasSpec &target = m_Output.chain.GetFinalTarget();

  AtlasSpec spec = source;
  spec.id = "registered";
  spec.parent.clear();
  spec.annotation_paths.clear();
  spec.structure_tree_paths.clear();
  bool trees_complete = true;

  // Atlas annotations brought into the sample come first
  for(unsigned int i = 0; i < target.annotation_paths.size(); i++)
    {
    const ImageRecord *found = nullptr;
    for(const auto &rec : m_Output.images)
      if(rec.direction == COMPOSE_INVERSE && rec.success && rec.input == target.annotation_paths[i])
        found = &rec;
    if(!found)
      continue;

    spec.annotation_paths.push_back(found->output);
    if(i < target.structure_tree_paths.size())
      spec.structure_tree_paths.push_back(
            GetTreeOutputFilename("target-to-source", op.target_to_source_prefix, target.structure_tree_paths[i]));
    else
      trees_complete = false;
    }

  for(unsigned int i = 0; i < source.annotation_paths.size(); i++)
    {
    spec.annotation_paths.push_back(source.annotation_paths[i]);
    if(i < source.structure_tree_paths.size())
      spec.structure_tree_paths.push_back(source.structure_tree_paths[i]);
    else
      trees_complete = false;
    }

  // Trees pair with annotations by position, a partial list would misalign them
  if(!trees_complete)
    spec.structure_tree_paths.clear();

  std::string dir = itksys::SystemTools::GetFilenamePath(op.target_template_output);
  if(dir.size() && !itksys::SystemTools::MakeDirectory(dir))
    throw AtlasRegException(AtlasRegException::InvalidSpec, "Unable to create directory %s", dir.c_str());

  AtlasRegConfiguration::SaveAtlasSpec(spec, op.target_template_output);
  m_StdOut->printf("-- [AtlasReg] sample atlas parameters with %d annotation(s) written to %s\n",
                   (int) spec.annotation_paths.size(), op.target_template_output.c_str());
}

template <typename TReal>
int
AtlasRegAPI<TReal>
::Run()
{
  m_Output = OutputType();
  this->ConfigThreads();

  // Everything that can be checked is checked before any registration
  m_Config.Validate();
  m_Output.chain = ChainResolver::Resolve(m_Config.sample, m_Config.atlases, m_Config.templates);
  m_StdOut->printf("-- [AtlasReg] chain of %d step(s):\n%s",
                   (int) m_Output.chain.size(), m_Output.chain.Describe().c_str());
  m_Config.ValidateFiles();

  const OutputParameters &op = m_Config.output;
  if(!itksys::SystemTools::MakeDirectory(op.directory))
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Unable to create output directory %s", op.directory.c_str());

  TransformIO<TReal> tio(op.directory + "/transforms", m_StdOut);
  WorkingImageCache<TReal> cache;
  if(!this->RunSteps(cache, tio))
    return 1;

  int rc = 0;
  bool want_forward = m_Output.chain.IsForwardRequested();
  bool want_inverse = m_Output.chain.IsInverseRequested();

  // The forward map is also needed to place atlas landmarks in the sample
  m_StdOut->printf("-- [AtlasReg] composing forward transform\n");
  m_Output.composed.push_back(ComposerType::ComposeForward(m_Output.results, VARIANT_FULL));

  if(want_inverse || m_Output.chain.GetSource().reference_points.size())
    {
    m_StdOut->printf("-- [AtlasReg] composing inverse transform\n");
    try
      {
      m_Output.composed.push_back(ComposerType::ComposeInverse(m_Output.results, VARIANT_FULL));
      }
    catch(AtlasRegException &exc)
      {
      if(exc.GetType() != AtlasRegException::NoInverseAvailable)
        throw;

      m_StdOut->printf("-- [AtlasReg] inverse transform is not available: %s\n", exc.what());
      if(want_inverse)
        {
        m_Output.errors.push_back(exc);
        rc = 1;
        }
      }
    }

  const ComposedType *fwd = m_Output.GetComposed(COMPOSE_FORWARD);
  const ComposedType *inv = m_Output.GetComposed(COMPOSE_INVERSE);

  if(want_forward)
    this->ApplyForward(*fwd);

  if(want_inverse && inv)
    this->ApplyInverse(*inv);

  std::vector<const ComposedType *> composed;
  for(const auto &ct : m_Output.composed)
    composed.push_back(&ct);
  tio.WriteComposed(composed, tio.GetDirectory() + "/composed.yaml");

  if(m_Output.landmarks.size())
    WriteLandmarkTable(m_Output.landmarks, (op.directory + "/reference_points.yaml").c_str());

  if(op.target_template_output.size())
    this->WriteTargetParameters();

  for(const auto &rec : m_Output.images)
    if(!rec.success)
      rc = 1;

  m_StdOut->printf("-- [AtlasReg] run finished with status %d\n", rc);
  return rc;
}

template <typename TReal>
int
AtlasRegAPI<TReal>
::DryRun()
{
  m_Config.Validate();
  m_Output = OutputType();
  m_Output.chain = ChainResolver::Resolve(m_Config.sample, m_Config.atlases, m_Config.templates);
  m_StdOut->printf("-- [AtlasReg] chain of %d step(s):\n%s",
                   (int) m_Output.chain.size(), m_Output.chain.Describe().c_str());
  m_Config.ValidateFiles();

  double tol = m_Config.output.downsample_tolerance;
  for(const auto &step : m_Output.chain)
    {
    ResolutionPlan plan = ResolutionManager<TReal>::ComputePlan(step, tol);
    const AtlasSpec *sides[] = { &step.fixed, &step.moving };
    DownsampleFactor factors[] = { plan.GetFixedFactor(), plan.GetMovingFactor() };
    for(int k = 0; k < 2; k++)
      {
      itk::Size<3> sz;
      for(unsigned int d = 0; d < 3; d++)
        sz[d] = sides[k]->size[d];
      itk::Size<3> wsz = ResolutionManager<TReal>::ComputeWorkingSize(sz, factors[k], tol, step, sides[k]->id);
      m_StdOut->printf("-- [AtlasReg] step %d: %s '%s' factor %gx%gx%g, working size %dx%dx%d\n",
                       step.index, k == 0 ? "fixed" : "moving", sides[k]->id.c_str(),
                       factors[k][0], factors[k][1], factors[k][2],
                       (int) wsz[0], (int) wsz[1], (int) wsz[2]);
      }
    }

  return 0;
}

template <typename TReal>
int
AtlasRegAPI<TReal>
::Run(const AtlasRegParameters &param)
{
  AtlasRegStdOut out(param.verbosity);
  AtlasRegConfiguration config = AtlasRegConfiguration::Load(param.fn_parameters);

  if(param.output_dir_override.size())
    config.output.directory = param.output_dir_override;
  if(param.greedy_executable_override.size())
    config.engine.greedy_executable = param.greedy_executable_override;
  if(param.threads_override >= 0)
    config.engine.threads = param.threads_override;
  if(param.no_reuse)
    config.output.reuse_transforms = false;
  if(config.engine.work_directory.empty())
    config.engine.work_directory = config.output.directory + "/engine";

  GreedyEngine<TReal> engine(config.engine, &out);
  AtlasRegAPI<TReal> api(config, &engine, &out);
  return param.dry_run ? api.DryRun() : api.Run();
}

template class AtlasRegAPI<float>;
template class AtlasRegAPI<double>;

} // namespace atlasreg
