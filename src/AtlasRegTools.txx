#include "AtlasRegTools.h"
#include "AtlasRegException.h"
#include <itkImageFileReader.h>
#include <itkImageFileWriter.h>
#include <itkResampleImageFilter.h>
#include <itkIdentityTransform.h>
#include <itkLinearInterpolateImageFunction.h>
#include <itkVectorLinearInterpolateImageFunction.h>
#include <itkNearestNeighborInterpolateImageFunction.h>
#include <itkBSplineInterpolateImageFunction.h>
#include <itkDiscreteGaussianImageFilter.h>
#include <vnl/vnl_matrix.h>
#include <fstream>
#include <cmath>

namespace atlasreg
{

template<typename TReal>
template<class TImage>
itk::SmartPointer<TImage>
AtlasRegTools<TReal>
::ReadImage(const std::string &filename)
{
  using TReader = itk::ImageFileReader<TImage>;
  typename TReader::Pointer reader = TReader::New();
  reader->SetFileName(filename.c_str());
  reader->Update();
  return reader->GetOutput();
}

template<typename TReal>
template<class TImage>
void
AtlasRegTools<TReal>
::WriteImage(TImage *img, const std::string &filename)
{
  typedef itk::ImageFileWriter<TImage> WriterType;
  typename WriterType::Pointer writer = WriterType::New();
  writer->SetFileName(filename.c_str());
  writer->SetUseCompression(true);
  writer->SetInput(img);
  writer->Update();
}

template<typename TReal>
typename AtlasRegTools<TReal>::TDisplacementField::Pointer
AtlasRegTools<TReal>
::ReadDisplacementField(const std::string &filename)
{
  return ReadImage<TDisplacementField>(filename);
}

template<typename TReal>
template<class TImage>
itk::SmartPointer<TImage>
AtlasRegTools<TReal>
::ResampleByFactor(TImage *input, const itk::Vector<double, 3> &factor, bool smooth)
{
  typedef itk::DiscreteGaussianImageFilter<TImage,TImage> SmoothFilter;
  typename TImage::Pointer imageToResample = input;

  // Smooth image if needed, sigma is given in voxels
  if(smooth)
    {
    typename SmoothFilter::Pointer fltSmooth = SmoothFilter::New();
    typename SmoothFilter::ArrayType variance;
    for(int i = 0; i < 3; ++i)
      variance[i] = factor[i] > 1.0 ? 0.25 * factor[i] * factor[i] : 0.0;

    fltSmooth->SetInput(input);
    fltSmooth->SetVariance(variance);
    fltSmooth->UseImageSpacingOff();
    fltSmooth->Update();
    imageToResample = fltSmooth->GetOutput();
    }

  ImageGeometry pre = ImageGeometry::FromImage(imageToResample.GetPointer());
  itk::Vector<double, 3> scale;
  for(unsigned int i = 0; i < 3; i++)
    scale[i] = 1.0 / factor[i];

  ImageGeometry post = pre.Rescaled(scale);

  return ResampleImage<TImage>(imageToResample.GetPointer(), post, nullptr, INTERP_LINEAR);
}

template<typename TReal>
template<class TImage>
itk::SmartPointer<TImage>
AtlasRegTools<TReal>
::ResampleImage(TImage *input, const ImageGeometry &grid,
                const TTransformBase *transform, InterpolationMode mode)
{
  typedef itk::ResampleImageFilter<TImage, TImage, double, double> ResampleFilter;
  typedef itk::LinearInterpolateImageFunction<TImage, double> LinearInterpolator;
  typedef itk::NearestNeighborInterpolateImageFunction<TImage, double> NNInterpolator;
  typedef itk::BSplineInterpolateImageFunction<TImage, double, double> BSplineInterpolator;

  typename ResampleFilter::Pointer fltResample = ResampleFilter::New();
  fltResample->SetInput(input);

  if(transform)
    fltResample->SetTransform(transform);
  else
    fltResample->SetTransform(itk::IdentityTransform<double, 3u>::New());

  switch(mode)
    {
    case INTERP_LINEAR:
      fltResample->SetInterpolator(LinearInterpolator::New());
      break;
    case INTERP_NEAREST:
      fltResample->SetInterpolator(NNInterpolator::New());
      break;
    case INTERP_BSPLINE:
      {
      typename BSplineInterpolator::Pointer bsp = BSplineInterpolator::New();
      bsp->SetSplineOrder(3);
      fltResample->SetInterpolator(bsp);
      }
      break;
    default:
      throw AtlasRegException(AtlasRegException::InvalidSpec, "Unknown interpolation mode %d", (int) mode);
    }

  typename TImage::SpacingType spc;
  for(unsigned int i = 0; i < 3; i++)
    spc[i] = grid.spacing[i];

  fltResample->SetSize(grid.size);
  fltResample->SetOutputSpacing(spc);
  fltResample->SetOutputOrigin(grid.origin);
  fltResample->SetOutputDirection(grid.direction);

  // Outside of the mapped domain
  fltResample->SetDefaultPixelValue(0);

  fltResample->UpdateLargestPossibleRegion();
  return fltResample->GetOutput();
}

template<typename TReal>
typename AtlasRegTools<TReal>::TDisplacementField::Pointer
AtlasRegTools<TReal>
::ResampleDisplacementField(TDisplacementField *field, const ImageGeometry &grid)
{
  typedef itk::ResampleImageFilter<TDisplacementField, TDisplacementField, double, double> ResampleFilter;
  typedef itk::VectorLinearInterpolateImageFunction<TDisplacementField, double> Interpolator;

  typename ResampleFilter::Pointer fltResample = ResampleFilter::New();
  fltResample->SetInput(field);
  fltResample->SetTransform(itk::IdentityTransform<double, 3u>::New());
  fltResample->SetInterpolator(Interpolator::New());

  typename TDisplacementField::SpacingType spc;
  for(unsigned int i = 0; i < 3; i++)
    spc[i] = grid.spacing[i];

  fltResample->SetSize(grid.size);
  fltResample->SetOutputSpacing(spc);
  fltResample->SetOutputOrigin(grid.origin);
  fltResample->SetOutputDirection(grid.direction);

  typename TDisplacementField::PixelType zero;
  zero.Fill(0.0);
  fltResample->SetDefaultPixelValue(zero);

  fltResample->UpdateLargestPossibleRegion();
  return fltResample->GetOutput();
}

template<typename TReal>
typename AtlasRegTools<TReal>::TAffineTransform::Pointer
AtlasRegTools<TReal>
::ReadAffineMatrix(const std::string &filename)
{
  // Physical (RAS) space transform matrix
  vnl_matrix<double> Qp(4, 4);
  Qp.set_identity();

  std::ifstream fin(filename.c_str());
  if(!fin.good())
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Unable to read affine matrix %s", filename.c_str());

  for(size_t i = 0; i < 4; i++)
    for(size_t j = 0; j < 4; j++)
      {
      if(!(fin >> Qp[i][j]))
        throw AtlasRegException(AtlasRegException::InvalidSpec,
                                "Affine matrix %s must contain 16 numbers", filename.c_str());
      }

  // RAS to LPS
  Qp(2,0) *= -1; Qp(2,1) *= -1;
  Qp(0,2) *= -1; Qp(1,2) *= -1;
  Qp(0,3) *= -1; Qp(1,3) *= -1;

  typename TAffineTransform::MatrixType matrix;
  typename TAffineTransform::OffsetType offset;
  for(size_t r = 0; r < 3; r++)
    {
    for(size_t c = 0; c < 3; c++)
      matrix(r, c) = Qp(r, c);
    offset[r] = Qp(r, 3);
    }

  typename TAffineTransform::Pointer tran = TAffineTransform::New();
  tran->SetMatrix(matrix);
  tran->SetOffset(offset);
  return tran;
}

template<typename TReal>
void
AtlasRegTools<TReal>
::WriteAffineMatrix(const TAffineTransform *tran, const std::string &filename)
{
  vnl_matrix<double> Q(4, 4);
  Q.set_identity();
  for(unsigned int i = 0; i < 3; i++)
    {
    for(unsigned int j = 0; j < 3; j++)
      Q(i,j) = tran->GetMatrix()(i,j);
    Q(i,3) = tran->GetOffset()[i];
    }

  // LPS to RAS
  Q(2,0) *= -1; Q(2,1) *= -1;
  Q(0,2) *= -1; Q(1,2) *= -1;
  Q(0,3) *= -1; Q(1,3) *= -1;

  std::ofstream matrixFile;
  matrixFile.open(filename.c_str());
  if(!matrixFile.good())
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Unable to write affine matrix %s", filename.c_str());
  matrixFile.precision(17);
  matrixFile << Q;
  matrixFile.close();
}

template<typename TReal>
itk::ContinuousIndex<double, 3>
AtlasRegTools<TReal>
::MapPixelCoordinate(const ImageGeometry &from, const ImageGeometry &to,
                     const TTransformBase *transform, const itk::ContinuousIndex<double, 3> &pixel)
{
  TPoint p = from.IndexToPhysical(pixel);
  TPoint q = transform ? transform->TransformPoint(p) : p;
  return to.PhysicalToIndex(q);
}

} // namespace atlasreg
