#include "ImageApplier.h"
#include "AtlasRegException.h"
#include <itksys/SystemTools.hxx>

namespace atlasreg
{

template <typename TReal>
ImageApplier<TReal>
::ImageApplier(RegistrationEngine<TReal> *engine, InterpolationMode intensity_mode,
               double tolerance, AtlasRegStdOut *out)
  : m_Engine(engine), m_IntensityMode(intensity_mode), m_Tolerance(tolerance)
{
  if(intensity_mode == INTERP_NEAREST)
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Intensity images need linear or B-spline interpolation");

  m_StdOut = out ? out : &m_DefaultStdOut;
}

template <typename TReal>
template <class TImage>
itk::SmartPointer<TImage>
ImageApplier<TReal>
::Normalize(TImage *image, const ImageGeometry &grid, InterpolationMode mode) const
{
  ImageGeometry geom = ImageGeometry::FromImage(image);
  if(geom.IsSameGrid(grid, m_Tolerance))
    return image;

  if(!geom.IsSameExtent(grid, m_Tolerance))
    throw AtlasRegException(AtlasRegException::GridMismatch,
                            "image grid %s is incompatible with the source grid %s",
                            geom.ToString().c_str(), grid.ToString().c_str());

  m_StdOut->printf("-- [AtlasReg] normalizing image grid %s to %s\n",
                   geom.ToString().c_str(), grid.ToString().c_str());

  return AtlasRegTools<TReal>::template ResampleImage<TImage>(image, grid, nullptr, mode);
}

template <typename TReal>
typename ImageApplier<TReal>::TImage3D::Pointer
ImageApplier<TReal>
::Apply(const ComposedType &ct, TImage3D *image)
{
  typename TImage3D::Pointer src = this->Normalize<TImage3D>(image, ct.source, m_IntensityMode);
  return m_Engine->ResampleImage(src, ct.reference, ct.GetTransform(), m_IntensityMode);
}

template <typename TReal>
typename ImageApplier<TReal>::TLabelImage3D::Pointer
ImageApplier<TReal>
::ApplyLabel(const ComposedType &ct, TLabelImage3D *image)
{
  typename TLabelImage3D::Pointer src = this->Normalize<TLabelImage3D>(image, ct.source, INTERP_NEAREST);
  return m_Engine->ResampleLabelImage(src, ct.reference, ct.GetTransform());
}

template <typename TReal>
std::vector<ImageRecord>
ImageApplier<TReal>
::ApplyAll(const ComposedType &ct, const std::vector<ImageJob> &jobs)
{
  std::vector<ImageRecord> records;
  for(const auto &job : jobs)
    {
    ImageRecord rec;
    rec.input = job.input;
    rec.output = job.output;
    rec.kind = job.kind;
    rec.direction = ct.direction;

    m_StdOut->printf("-- [AtlasReg] applying %s transform to %s image %s\n",
                     ct.direction == COMPOSE_FORWARD ? "forward" : "inverse",
                     job.kind == IMAGE_LABEL ? "label" : "intensity",
                     job.input.c_str());

    std::string dir = itksys::SystemTools::GetFilenamePath(job.output);
    if(dir.size() && !itksys::SystemTools::MakeDirectory(dir))
      throw AtlasRegException(AtlasRegException::InvalidSpec, "Unable to create directory %s", dir.c_str());

    try
      {
      if(job.kind == IMAGE_LABEL)
        {
        auto img = AtlasRegTools<TReal>::template ReadImage<TLabelImage3D>(job.input);
        auto res = this->ApplyLabel(ct, img);
        AtlasRegTools<TReal>::template WriteImage<TLabelImage3D>(res, job.output);
        }
      else
        {
        auto img = AtlasRegTools<TReal>::template ReadImage<TImage3D>(job.input);
        auto res = this->Apply(ct, img);
        AtlasRegTools<TReal>::template WriteImage<TImage3D>(res, job.output);
        }
      rec.success = true;
      }
    catch(AtlasRegException &exc)
      {
      if(exc.GetType() != AtlasRegException::GridMismatch)
        throw;

      rec.success = false;
      rec.message = exc.GetMessage();
      m_StdOut->printf("-- [AtlasReg] skipping %s: %s\n", job.input.c_str(), rec.message.c_str());
      }

    records.push_back(rec);
    }

  return records;
}

template <typename TReal>
std::vector<ReferencePoint>
ImageApplier<TReal>
::MapPoints(const ComposedType &ct, const std::vector<ReferencePoint> &points) const
{
  std::vector<ReferencePoint> mapped;
  for(const auto &rp : points)
    {
    itk::ContinuousIndex<double, 3> idx;
    for(unsigned int d = 0; d < 3; d++)
      idx[d] = rp.pixel[d];

    itk::ContinuousIndex<double, 3> res =
        AtlasRegTools<TReal>::MapPixelCoordinate(ct.reference, ct.source, ct.GetTransform(), idx);

    ReferencePoint out;
    out.name = rp.name;
    for(unsigned int d = 0; d < 3; d++)
      out.pixel[d] = res[d];
    mapped.push_back(out);

    m_StdOut->print_verbose("-- [AtlasReg] point %s: (%g, %g, %g) -> (%g, %g, %g)\n", rp.name.c_str(),
                            rp.pixel[0], rp.pixel[1], rp.pixel[2], out.pixel[0], out.pixel[1], out.pixel[2]);
    }
  return mapped;
}

template class ImageApplier<float>;
template class ImageApplier<double>;

} // namespace atlasreg
