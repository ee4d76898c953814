#ifndef IMAGEAPPLIER_H
#define IMAGEAPPLIER_H

#include "TransformComposer.h"
#include "AtlasRegStdOut.h"
#include <string>
#include <vector>

namespace atlasreg
{

/** Outcome of applying a composed transform to one associated image */
struct ImageRecord
{
  std::string input;
  std::string output;
  ImageKind kind = IMAGE_INTENSITY;
  ComposeDirection direction = COMPOSE_FORWARD;
  bool success = false;
  std::string message;
};

/** One associated image to bring through a composed transform */
struct ImageJob
{
  std::string input;
  std::string output;
  ImageKind kind = IMAGE_INTENSITY;
};

/**
 * Resamples images through a composed transform onto its reference grid.
 * Images are expected on the composed transform's source grid; an image that
 * covers the same physical extent with a different sampling is first brought
 * onto the source grid, anything else is a GridMismatch.
 */
template <typename TReal>
class ImageApplier
{
public:
  ATLASREG_TYPEDEFS
  typedef ComposedTransform<TReal> ComposedType;

  ImageApplier(RegistrationEngine<TReal> *engine, InterpolationMode intensity_mode,
               double tolerance, AtlasRegStdOut *out = nullptr);
  ImageApplier(const ImageApplier &) = delete;
  ImageApplier &operator=(const ImageApplier &) = delete;

  /** Resample an intensity image (linear or B-spline) */
  typename TImage3D::Pointer Apply(const ComposedType &ct, TImage3D *image);

  /** Resample a label image, nearest neighbour only */
  typename TLabelImage3D::Pointer ApplyLabel(const ComposedType &ct, TLabelImage3D *image);

  /**
   * Read, resample and write every job. A GridMismatch fails only its own
   * image and is reported in the returned records.
   */
  std::vector<ImageRecord> ApplyAll(const ComposedType &ct, const std::vector<ImageJob> &jobs);

  /**
   * Map pixel coordinates of the composed transform's reference grid to pixel
   * coordinates of its source grid
   */
  std::vector<ReferencePoint> MapPoints(const ComposedType &ct,
                                        const std::vector<ReferencePoint> &points) const;

  /** Bring an image onto the grid it claims to share, or throw GridMismatch */
  template <class TImage>
  itk::SmartPointer<TImage> Normalize(TImage *image, const ImageGeometry &grid,
                                      InterpolationMode mode) const;

private:
  RegistrationEngine<TReal> *m_Engine;
  InterpolationMode m_IntensityMode;
  double m_Tolerance;
  AtlasRegStdOut *m_StdOut;
  AtlasRegStdOut m_DefaultStdOut;
};

} // namespace atlasreg

#endif // IMAGEAPPLIER_H
