#include "ResolutionManager.h"
#include "AtlasRegTools.h"
#include "AtlasRegException.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace atlasreg
{

//==================================================
// WorkingImageCache
//==================================================

template <typename TReal>
typename WorkingImageCache<TReal>::Key
WorkingImageCache<TReal>
::MakeKey(const std::string &id, const DownsampleFactor &factor)
{
  std::array<long long, 3> k;
  for(unsigned int d = 0; d < 3; d++)
    k[d] = (long long) std::floor(factor[d] * 1.0e6 + 0.5);
  return Key(id, k);
}

template <typename TReal>
typename WorkingImageCache<TReal>::ImagePointer
WorkingImageCache<TReal>
::GetOrCreate(const std::string &id, const DownsampleFactor &factor, const Producer &producer)
{
  Key key = MakeKey(id, factor);
  std::promise<ImagePointer> promise;
  std::shared_future<ImagePointer> future;
  bool is_producer = false;

  {
  std::lock_guard<std::mutex> lock(m_Mutex);
  auto it = m_Entries.find(key);
  if(it != m_Entries.end())
    {
    future = it->second;
    }
  else
    {
    future = promise.get_future().share();
    m_Entries[key] = future;
    m_Productions++;
    is_producer = true;
    }
  }

  // Another requester produces the image, wait for it
  if(!is_producer)
    return future.get();

  try
    {
    promise.set_value(producer());
    }
  catch(...)
    {
    // Drop the entry so that a later request can retry, and hand the
    // error to the requesters waiting on it
    {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Entries.erase(key);
    }
    promise.set_exception(std::current_exception());
    throw;
    }

  return future.get();
}

template <typename TReal>
void
WorkingImageCache<TReal>
::Insert(const std::string &id, const DownsampleFactor &factor, TImage3D *image)
{
  std::promise<ImagePointer> promise;
  promise.set_value(ImagePointer(image));

  std::lock_guard<std::mutex> lock(m_Mutex);
  m_Entries[MakeKey(id, factor)] = promise.get_future().share();
}

template <typename TReal>
bool
WorkingImageCache<TReal>
::Contains(const std::string &id, const DownsampleFactor &factor) const
{
  std::lock_guard<std::mutex> lock(m_Mutex);
  return m_Entries.find(MakeKey(id, factor)) != m_Entries.end();
}

template <typename TReal>
size_t
WorkingImageCache<TReal>
::GetNumberOfEntries() const
{
  std::lock_guard<std::mutex> lock(m_Mutex);
  return m_Entries.size();
}

template <typename TReal>
unsigned int
WorkingImageCache<TReal>
::GetNumberOfProductions() const
{
  std::lock_guard<std::mutex> lock(m_Mutex);
  return m_Productions;
}

//==================================================
// ResolutionManager
//==================================================

template <typename TReal>
ResolutionManager<TReal>
::ResolutionManager(WorkingImageCache<TReal> *cache, double tolerance, AtlasRegStdOut *out)
  : m_Cache(cache), m_Tolerance(tolerance), m_StdOut(out ? out : &m_DefaultStdOut),
    m_DefaultStdOut(AtlasRegStdOut::VERB_NONE)
{
}

// Six decimals are kept, e.g. 25/10 gives exactly 2.5
static double round_factor(double f)
{
  return std::floor(f * 1.0e6 + 0.5) / 1.0e6;
}

static std::string format_factor(const DownsampleFactor &f)
{
  char buffer[128];
  if(f[0] == f[1] && f[1] == f[2])
    snprintf(buffer, sizeof(buffer), "%g", f[0]);
  else
    snprintf(buffer, sizeof(buffer), "%gx%gx%g", f[0], f[1], f[2]);
  return buffer;
}

template <typename TReal>
ResolutionPlan
ResolutionManager<TReal>
::ComputePlan(const RegistrationStep &step, double tolerance)
{
  ResolutionPlan plan;
  double rf = step.fixed.GetMeanResolution();
  double rm = step.moving.GetMeanResolution();

  if(step.fixed.resolution.size() != 3 || step.moving.resolution.size() != 3)
    throw AtlasRegException(AtlasRegException::UnsupportedDownsample,
                            "resolution needs 3 components to compute the factor")
        .SetStep(step.index).SetSpec(step.moving.id, step.fixed.id);

  // Per axis ratio of the coarser to the finer resolution
  const AtlasSpec &coarse = rf >= rm ? step.fixed : step.moving;
  const AtlasSpec &fine = rf >= rm ? step.moving : step.fixed;
  DownsampleFactor ratio;
  bool same_resolution = true;
  for(unsigned int d = 0; d < 3; d++)
    {
    ratio[d] = round_factor(coarse.resolution[d] / fine.resolution[d]);
    if(std::fabs(ratio[d] - 1.0) > tolerance)
      same_resolution = false;
    }

  if(step.downsampling_auto)
    {
    // Axes where the finer side is already coarser stay as they are
    for(unsigned int d = 0; d < 3; d++)
      plan.factor[d] = std::max(ratio[d], 1.0);
    }
  else
    {
    double f = round_factor(step.downsampling);
    if(!(f >= 1.0))
      throw AtlasRegException(AtlasRegException::UnsupportedDownsample,
                              "downsampling factor %g is below 1", f)
          .SetStep(step.index).SetSpec(step.moving.id, step.fixed.id);

    // The factor has to bring the finer grid onto the sampling of the coarser one
    if(f > 1.0 && !same_resolution)
      {
      for(unsigned int d = 0; d < 3; d++)
        if(std::fabs(f - ratio[d]) > tolerance * ratio[d])
          throw AtlasRegException(AtlasRegException::UnsupportedDownsample,
                                  "factor %g does not relate '%s' to '%s' on axis %d (resolution ratio %g)",
                                  f, fine.id.c_str(), coarse.id.c_str(), d, ratio[d])
              .SetStep(step.index).SetSpec(step.moving.id, step.fixed.id);
      }
    plan.factor.Fill(f);
    }

  if(!plan.IsIdentity())
    {
    plan.downsample_fixed = rf <= rm;
    plan.downsample_moving = rm <= rf;
    }

  // The factor has to divide the sizes listed in the specs
  itk::Size<3> sz;
  if(plan.downsample_fixed && step.fixed.size.size() == 3)
    {
    for(unsigned int d = 0; d < 3; d++)
      sz[d] = step.fixed.size[d];
    ComputeWorkingSize(sz, plan.factor, tolerance, step, step.fixed.id);
    }
  if(plan.downsample_moving && step.moving.size.size() == 3)
    {
    for(unsigned int d = 0; d < 3; d++)
      sz[d] = step.moving.size[d];
    ComputeWorkingSize(sz, plan.factor, tolerance, step, step.moving.id);
    }

  return plan;
}

template <typename TReal>
itk::Size<3>
ResolutionManager<TReal>
::ComputeWorkingSize(const itk::Size<3> &size, const DownsampleFactor &factor, double tolerance,
                     const RegistrationStep &step, const std::string &spec_id)
{
  itk::Size<3> out;
  for(unsigned int d = 0; d < 3; d++)
    {
    double q = size[d] / factor[d];
    double qr = std::floor(q + 0.5);
    if(qr < 1 || std::fabs(q - qr) > tolerance)
      throw AtlasRegException(AtlasRegException::UnsupportedDownsample,
                              "factor %g does not divide size %d of '%s' on axis %d (%g)",
                              factor[d], (int) size[d], spec_id.c_str(), d, q)
          .SetStep(step.index).SetSpec(step.moving.id, step.fixed.id);
    out[d] = (itk::SizeValueType) qr;
    }
  return out;
}

template <typename TReal>
typename ResolutionManager<TReal>::TImage3D::Pointer
ResolutionManager<TReal>
::GetFullResolutionImage(const AtlasSpec &spec)
{
  std::string fn = spec.template_path;
  return m_Cache->GetOrCreate(spec.id, MakeIsotropicFactor(1.0), [fn]() {
    return AtlasRegTools<TReal>::template ReadImage<TImage3D>(fn);
    });
}

template <typename TReal>
typename ResolutionManager<TReal>::TImage3D::Pointer
ResolutionManager<TReal>
::GetWorkingImage(const RegistrationStep &step, const AtlasSpec &spec,
                  const DownsampleFactor &factor, itk::Vector<double, 3> &scale)
{
  typename TImage3D::Pointer full = GetFullResolutionImage(spec);
  scale.Fill(1.0);
  if(factor == MakeIsotropicFactor(1.0))
    return full;

  itk::Size<3> sz = ComputeWorkingSize(
        full->GetLargestPossibleRegion().GetSize(), factor, m_Tolerance, step, spec.id);

  bool cached = m_Cache->Contains(spec.id, factor);
  typename TImage3D::Pointer working = m_Cache->GetOrCreate(spec.id, factor, [full, factor]() {
    return AtlasRegTools<TReal>::template ResampleByFactor<TImage3D>(full.GetPointer(), factor, true);
    });

  if(working->GetLargestPossibleRegion().GetSize() != sz)
    throw AtlasRegException(AtlasRegException::UnsupportedDownsample,
                            "working image of '%s' has unexpected size", spec.id.c_str())
        .SetStep(step.index).SetSpec(step.moving.id, step.fixed.id);

  for(unsigned int d = 0; d < 3; d++)
    scale[d] = working->GetSpacing()[d] / full->GetSpacing()[d];

  m_StdOut->printf("-- [AtlasReg] step %d: %s working image of '%s' downsampled by %s to %dx%dx%d\n",
                   step.index, cached ? "cached" : "new", spec.id.c_str(), format_factor(factor).c_str(),
                   (int) sz[0], (int) sz[1], (int) sz[2]);

  return working;
}

template <typename TReal>
WorkingImages<TReal>
ResolutionManager<TReal>
::Prepare(const RegistrationStep &step)
{
  WorkingImages<TReal> wi;
  wi.plan = ComputePlan(step, m_Tolerance);

  m_StdOut->printf("-- [AtlasReg] step %d: working factor %s (fixed %s, moving %s)\n",
                   step.index, format_factor(wi.plan.factor).c_str(),
                   format_factor(wi.plan.GetFixedFactor()).c_str(),
                   format_factor(wi.plan.GetMovingFactor()).c_str());

  wi.fixed = GetWorkingImage(step, step.fixed, wi.plan.GetFixedFactor(), wi.scale_fixed);
  wi.moving = GetWorkingImage(step, step.moving, wi.plan.GetMovingFactor(), wi.scale_moving);
  return wi;
}

template class WorkingImageCache<float>;
template class WorkingImageCache<double>;
template class ResolutionManager<float>;
template class ResolutionManager<double>;

} // namespace atlasreg
