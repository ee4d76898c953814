#ifndef ATLASREGCOMMON_H
#define ATLASREGCOMMON_H

#include <itkImage.h>
#include <itkVector.h>
#include <itkMatrixOffsetTransformBase.h>
#include <itkDisplacementFieldTransform.h>
#include <itkCompositeTransform.h>

namespace atlasreg
{

/**
 * Image and transform types shared by the orchestrator. Intensity images
 * use the floating point type of the run; transforms are always in double
 * precision and in ITK physical (LPS) space.
 */
template <typename TReal>
class AtlasRegTypes
{
public:
  using TImage3D = itk::Image<TReal, 3>;
  using TLabelImage3D = itk::Image<unsigned int, 3>;
  using TAffineTransform = itk::MatrixOffsetTransformBase<double, 3, 3>;
  using TWarpTransform = itk::DisplacementFieldTransform<double, 3>;
  using TDisplacementField = typename TWarpTransform::DisplacementFieldType;
  using TCompositeTransform = itk::CompositeTransform<double, 3>;
  using TTransformBase = itk::Transform<double, 3, 3>;
  using TPoint = itk::Point<double, 3>;
};

enum InterpolationMode { INTERP_LINEAR = 0, INTERP_BSPLINE, INTERP_NEAREST };

enum ImageKind { IMAGE_INTENSITY = 0, IMAGE_LABEL };

} // namespace atlasreg

#define ATLASREG_TYPEDEFS \
using TImage3D = typename AtlasRegTypes<TReal>::TImage3D; \
using TLabelImage3D = typename AtlasRegTypes<TReal>::TLabelImage3D; \
using TAffineTransform = typename AtlasRegTypes<TReal>::TAffineTransform; \
using TWarpTransform = typename AtlasRegTypes<TReal>::TWarpTransform; \
using TDisplacementField = typename AtlasRegTypes<TReal>::TDisplacementField; \
using TCompositeTransform = typename AtlasRegTypes<TReal>::TCompositeTransform; \
using TTransformBase = typename AtlasRegTypes<TReal>::TTransformBase; \
using TPoint = typename AtlasRegTypes<TReal>::TPoint;

#endif // ATLASREGCOMMON_H
