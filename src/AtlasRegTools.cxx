#include "AtlasRegTools.h"
#include <sstream>
#include <cmath>

namespace atlasreg
{

ImageGeometry
ImageGeometry
::FromImage(const itk::ImageBase<3> *image)
{
  ImageGeometry g;
  g.size = image->GetLargestPossibleRegion().GetSize();
  for(unsigned int d = 0; d < 3; d++)
    g.spacing[d] = image->GetSpacing()[d];
  g.origin = image->GetOrigin();
  g.direction = image->GetDirection();
  return g;
}

void
ImageGeometry
::ApplyTo(itk::ImageBase<3> *image) const
{
  itk::ImageRegion<3> region;
  region.SetSize(size);
  image->SetRegions(region);

  itk::ImageBase<3>::SpacingType spc;
  for(unsigned int d = 0; d < 3; d++)
    spc[d] = spacing[d];
  image->SetSpacing(spc);
  image->SetOrigin(origin);
  image->SetDirection(direction);
}

ImageGeometry
ImageGeometry
::Rescaled(const itk::Vector<double, 3> &scale) const
{
  ImageGeometry g = *this;
  for(unsigned int d = 0; d < 3; d++)
    {
    g.size[d] = (itk::SizeValueType) std::floor(size[d] * scale[d] + 0.5);
    g.spacing[d] = spacing[d] * size[d] / g.size[d];
    }

  // The origin is the center of voxel 0, it moves with the voxel size
  itk::Vector<double, 3> off_pre = (direction * spacing) * 0.5;
  itk::Vector<double, 3> off_post = (direction * g.spacing) * 0.5;
  g.origin = origin - off_pre + off_post;
  return g;
}

bool
ImageGeometry
::IsSameGrid(const ImageGeometry &other, double tol) const
{
  if(size != other.size)
    return false;

  for(unsigned int d = 0; d < 3; d++)
    {
    if(std::fabs(spacing[d] - other.spacing[d]) > tol * spacing[d])
      return false;
    if(std::fabs(origin[d] - other.origin[d]) > tol * spacing[d])
      return false;
    for(unsigned int k = 0; k < 3; k++)
      if(std::fabs(direction(d, k) - other.direction(d, k)) > tol)
        return false;
    }

  return true;
}

bool
ImageGeometry
::IsSameExtent(const ImageGeometry &other, double tol) const
{
  for(unsigned int d = 0; d < 3; d++)
    {
    for(unsigned int k = 0; k < 3; k++)
      if(std::fabs(direction(d, k) - other.direction(d, k)) > tol)
        return false;

    double ext = spacing[d] * size[d];
    double ext_other = other.spacing[d] * other.size[d];
    if(std::fabs(ext - ext_other) > tol * spacing[d])
      return false;
    }

  // Compare the corners of the first voxels
  itk::Point<double, 3> c = origin - (direction * spacing) * 0.5;
  itk::Point<double, 3> c_other = other.origin - (other.direction * other.spacing) * 0.5;
  for(unsigned int d = 0; d < 3; d++)
    if(std::fabs(c[d] - c_other[d]) > tol * spacing[d])
      return false;

  return true;
}

itk::Point<double, 3>
ImageGeometry
::IndexToPhysical(const itk::ContinuousIndex<double, 3> &idx) const
{
  itk::Vector<double, 3> v;
  for(unsigned int d = 0; d < 3; d++)
    v[d] = idx[d] * spacing[d];
  return origin + direction * v;
}

itk::ContinuousIndex<double, 3>
ImageGeometry
::PhysicalToIndex(const itk::Point<double, 3> &pt) const
{
  itk::Matrix<double, 3, 3> dinv(direction.GetInverse());
  itk::Vector<double, 3> v = dinv * (pt - origin);

  itk::ContinuousIndex<double, 3> idx;
  for(unsigned int d = 0; d < 3; d++)
    idx[d] = v[d] / spacing[d];
  return idx;
}

std::string
ImageGeometry
::ToString() const
{
  std::ostringstream oss;
  oss << "size " << size[0] << "x" << size[1] << "x" << size[2]
      << ", spacing " << spacing[0] << "x" << spacing[1] << "x" << spacing[2]
      << ", origin (" << origin[0] << ", " << origin[1] << ", " << origin[2] << ")";
  return oss.str();
}

} // namespace atlasreg
