#ifndef REGISTRATIONENGINE_H
#define REGISTRATIONENGINE_H

#include "AtlasRegCommon.h"
#include "AtlasRegTools.h"
#include "AtlasSpec.h"
#include <string>
#include <vector>

namespace atlasreg
{

/**
 * One transform produced by a registration pass. Maps physical points of
 * the fixed image to physical points of the moving image (LPS).
 */
template <typename TReal>
struct TransformLeg
{
  ATLASREG_TYPEDEFS

  enum Kind { AFFINE = 0, DEFORMABLE };

  Kind kind = AFFINE;
  std::string template_name;

  // Set for affine legs
  typename TAffineTransform::Pointer affine;

  // Set for deformable legs, both fields are defined on the fixed grid
  typename TDisplacementField::Pointer warp;
  typename TDisplacementField::Pointer inverse_warp;

  // False when the template was declared non-invertible
  bool invertible = true;

  bool HasInverse() const
  {
    if(!invertible)
      return false;
    return kind == AFFINE ? affine.IsNotNull() : inverse_warp.IsNotNull();
  }
};

/**
 * Output of one chain step. The legs compose to the step transform
 * T = legs[0] o legs[1] o ... o legs[k-1]: the last leg is applied first to a
 * fixed space point. Never modified once the step has completed.
 */
template <typename TReal>
struct TransformResult
{
  unsigned int step = 0;
  std::string moving_id, fixed_id;
  std::vector<TransformLeg<TReal> > legs;

  // Working grids the step was registered on, and their scale to full resolution
  ImageGeometry fixed_working, moving_working;
  itk::Vector<double, 3> scale_fixed, scale_moving;

  // Concatenated engine logs, for diagnostics only
  std::string log;

  // True when the result was read back from a previous run
  bool reused = false;

  bool HasInverse() const
  {
    for(const auto &leg : legs)
      if(!leg.HasInverse())
        return false;
    return true;
  }
};

/**
 * Interface to the external registration engine: register two images with a
 * transform template, and resample images through a transform.
 */
template <typename TReal>
class RegistrationEngine
{
public:
  ATLASREG_TYPEDEFS
  typedef TransformLeg<TReal> LegType;

  virtual ~RegistrationEngine() {}

  /**
   * Run one registration pass. The initial legs (in TransformResult order) seed
   * the pass. On success, returns 0 and fills out_leg; otherwise returns a
   * non-zero status. The engine's log is appended to 'log' in both cases.
   */
  virtual int Register(TImage3D *fixed, TImage3D *moving,
                       const TransformTemplate &tmpl,
                       const std::vector<LegType> &initial,
                       bool want_inverse,
                       LegType &out_leg,
                       std::string &log) = 0;

  /** Resample an intensity image onto a grid, the transform maps grid points to image points */
  virtual typename TImage3D::Pointer ResampleImage(
      TImage3D *image, const ImageGeometry &grid, const TTransformBase *transform, InterpolationMode mode)
  {
    return AtlasRegTools<TReal>::template ResampleImage<TImage3D>(image, grid, transform, mode);
  }

  /** Resample a label image with nearest neighbour interpolation */
  virtual typename TLabelImage3D::Pointer ResampleLabelImage(
      TLabelImage3D *image, const ImageGeometry &grid, const TTransformBase *transform)
  {
    return AtlasRegTools<TReal>::template ResampleImage<TLabelImage3D>(image, grid, transform, INTERP_NEAREST);
  }
};

} // namespace atlasreg

#endif // REGISTRATIONENGINE_H
