#ifndef RESOLUTIONMANAGER_H
#define RESOLUTIONMANAGER_H

#include "AtlasRegCommon.h"
#include "AtlasRegStdOut.h"
#include "ChainResolver.h"
#include <map>
#include <array>
#include <mutex>
#include <future>
#include <functional>
#include <string>

namespace atlasreg
{

/** Per axis downsampling factor */
typedef itk::Vector<double, 3> DownsampleFactor;

inline DownsampleFactor MakeIsotropicFactor(double f)
{
  DownsampleFactor v;
  v.Fill(f);
  return v;
}

/**
 * Working resolution of one step. The per axis factor applies to the finer of
 * the two templates (to both if they have the same resolution); the coarser
 * one is used at full resolution.
 */
struct ResolutionPlan
{
  DownsampleFactor factor = MakeIsotropicFactor(1.0);
  bool downsample_fixed = false;
  bool downsample_moving = false;

  DownsampleFactor GetFixedFactor() const
    { return downsample_fixed ? factor : MakeIsotropicFactor(1.0); }
  DownsampleFactor GetMovingFactor() const
    { return downsample_moving ? factor : MakeIsotropicFactor(1.0); }

  bool IsIdentity() const
    { return factor[0] == 1.0 && factor[1] == 1.0 && factor[2] == 1.0; }
};

/**
 * Template images of one run, at full and at working resolution, keyed by
 * (spec identity, per axis factor). Each entry is produced at most once: the first
 * requester runs the producer, concurrent requesters for the same key wait for
 * its result. Entries are never visible before they are complete.
 */
template <typename TReal>
class WorkingImageCache
{
public:
  ATLASREG_TYPEDEFS
  typedef typename TImage3D::Pointer ImagePointer;
  typedef std::function<ImagePointer()> Producer;

  WorkingImageCache() : m_Productions(0) {}

  /** Return the cached image, or produce and cache it */
  ImagePointer GetOrCreate(const std::string &id, const DownsampleFactor &factor, const Producer &producer);

  /** Store an image that was produced elsewhere, e.g. an already loaded template */
  void Insert(const std::string &id, const DownsampleFactor &factor, TImage3D *image);

  bool Contains(const std::string &id, const DownsampleFactor &factor) const;

  size_t GetNumberOfEntries() const;

  /** Number of times a producer was run */
  unsigned int GetNumberOfProductions() const;

private:
  typedef std::pair<std::string, std::array<long long, 3> > Key;

  // Factors are compared with six decimals
  static Key MakeKey(const std::string &id, const DownsampleFactor &factor);

  mutable std::mutex m_Mutex;
  std::map<Key, std::shared_future<ImagePointer> > m_Entries;
  unsigned int m_Productions;
};

/** Working images of one step and the scale between working and full grids */
template <typename TReal>
struct WorkingImages
{
  typename AtlasRegTypes<TReal>::TImage3D::Pointer fixed;
  typename AtlasRegTypes<TReal>::TImage3D::Pointer moving;

  // Per axis working spacing over full spacing
  itk::Vector<double, 3> scale_fixed;
  itk::Vector<double, 3> scale_moving;

  ResolutionPlan plan;
};

template <typename TReal>
class ResolutionManager
{
public:
  ATLASREG_TYPEDEFS

  ResolutionManager(WorkingImageCache<TReal> *cache, double tolerance, AtlasRegStdOut *out = nullptr);
  ResolutionManager(const ResolutionManager &) = delete;
  ResolutionManager &operator=(const ResolutionManager &) = delete;

  /**
   * Work out the per axis factor and the side(s) it applies to from the step's
   * atlas specs. An automatic factor is the per axis ratio of the coarser to
   * the finer resolution, never below 1. An explicit factor above 1 must match
   * that ratio on every axis within tolerance, unless both sides have the same
   * resolution. Throws UnsupportedDownsample for factors below 1, for factors
   * that do not relate the two grids and for sizes the factor does not divide.
   */
  static ResolutionPlan ComputePlan(const RegistrationStep &step, double tolerance);

  /** Size of the grid downsampled by factor, throws if the factor does not divide the size */
  static itk::Size<3> ComputeWorkingSize(const itk::Size<3> &size, const DownsampleFactor &factor,
                                         double tolerance, const RegistrationStep &step,
                                         const std::string &spec_id);

  /** Working fixed and moving images of a step, taken from the cache when available */
  WorkingImages<TReal> Prepare(const RegistrationStep &step);

  /** Template of a spec at full resolution, read once per run */
  typename TImage3D::Pointer GetFullResolutionImage(const AtlasSpec &spec);

private:
  typename TImage3D::Pointer GetWorkingImage(const RegistrationStep &step, const AtlasSpec &spec,
                                             const DownsampleFactor &factor, itk::Vector<double, 3> &scale);

  WorkingImageCache<TReal> *m_Cache;
  double m_Tolerance;
  AtlasRegStdOut *m_StdOut;
  AtlasRegStdOut m_DefaultStdOut;
};

} // namespace atlasreg

#endif // RESOLUTIONMANAGER_H
