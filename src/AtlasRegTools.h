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
#ifndef ATLASREGTOOLS_H
#define ATLASREGTOOLS_H

#include "AtlasRegCommon.h"
#include <itkImageBase.h>
#include <itkSize.h>
#include <itkMatrix.h>
#include <itkContinuousIndex.h>
#include <string>

namespace atlasreg
{

/**
 * Sampling grid of a 3D image: size, spacing, origin and direction.
 */
struct ImageGeometry
{
  itk::Size<3> size;
  itk::Vector<double, 3> spacing;
  itk::Point<double, 3> origin;
  itk::Matrix<double, 3, 3> direction;

  ImageGeometry()
  {
    size.Fill(0);
    spacing.Fill(1.0);
    origin.Fill(0.0);
    direction.SetIdentity();
  }

  static ImageGeometry FromImage(const itk::ImageBase<3> *image);

  /** Set the grid of an image (allocation is left to the caller) */
  void ApplyTo(itk::ImageBase<3> *image) const;

  /**
   * Grid covering the same physical extent with the spacing divided by the
   * per-axis scale, i.e. the full resolution grid of a working grid whose
   * spacing was scaled up by 'scale'.
   */
  ImageGeometry Rescaled(const itk::Vector<double, 3> &scale) const;

  /** Same size, and spacing, origin and direction equal within tolerance */
  bool IsSameGrid(const ImageGeometry &other, double tol) const;

  /** Same physical extent and direction, possibly sampled differently */
  bool IsSameExtent(const ImageGeometry &other, double tol) const;

  itk::Point<double, 3> IndexToPhysical(const itk::ContinuousIndex<double, 3> &idx) const;

  itk::ContinuousIndex<double, 3> PhysicalToIndex(const itk::Point<double, 3> &pt) const;

  std::string ToString() const;
};

/**
 * Static helpers for image and transform IO and resampling
 */
template <typename TReal>
class AtlasRegTools
{
public:
  ATLASREG_TYPEDEFS

  template<class TImage>
  static itk::SmartPointer<TImage> ReadImage(const std::string &filename);

  template<class TImage>
  static void WriteImage(TImage *img, const std::string &filename);

  /** Read a displacement field in physical (LPS) space */
  static typename TDisplacementField::Pointer ReadDisplacementField(const std::string &filename);

  /**
   * Downsample an image by a per axis factor: the output covers the same
   * physical extent with size/factor voxels. With 'smooth', the input is first
   * smoothed with a Gaussian of 0.5*factor voxels on each downsampled axis.
   */
  template<class TImage>
  static itk::SmartPointer<TImage> ResampleByFactor(TImage *input, const itk::Vector<double, 3> &factor,
                                                    bool smooth);

  /** Resample an image onto a grid through a transform mapping grid points to input points */
  template<class TImage>
  static itk::SmartPointer<TImage> ResampleImage(TImage *input, const ImageGeometry &grid,
                                                 const TTransformBase *transform,
                                                 InterpolationMode mode);

  /** Linearly resample a displacement field onto another grid, zero outside */
  static typename TDisplacementField::Pointer ResampleDisplacementField(
      TDisplacementField *field, const ImageGeometry &grid);

  /**
   * Read a matrix in greedy format (4x4 text, RAS physical space) and convert
   * it to an ITK transform in LPS physical space
   */
  static typename TAffineTransform::Pointer ReadAffineMatrix(const std::string &filename);

  /** Write a transform as a 4x4 RAS matrix in greedy format */
  static void WriteAffineMatrix(const TAffineTransform *tran, const std::string &filename);

  /** Map a pixel coordinate through a transform into another image's pixel space */
  static itk::ContinuousIndex<double, 3> MapPixelCoordinate(
      const ImageGeometry &from, const ImageGeometry &to,
      const TTransformBase *transform, const itk::ContinuousIndex<double, 3> &pixel);
};

} // namespace atlasreg

#include "AtlasRegTools.txx"

#endif // ATLASREGTOOLS_H
