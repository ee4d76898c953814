#include "ImageFilterPipeline.h"
#include "AtlasRegException.h"
#include <itkMedianImageFilter.h>
#include <itkMeanImageFilter.h>
#include <itkSmoothingRecursiveGaussianImageFilter.h>
#include <sstream>
#include <cstdlib>

namespace atlasreg
{

template <typename TReal>
ImageFilterPipeline<TReal>
::ImageFilterPipeline(const std::string &text)
  : m_Text(text)
{
  std::istringstream iss(text);
  std::string stage;
  while(std::getline(iss, stage, '-'))
    {
    std::istringstream ss(stage);
    std::string tok;
    std::vector<std::string> tokens;
    while(std::getline(ss, tok, ','))
      tokens.push_back(tok);

    if(tokens.size() != 4 || tokens[0].size() != 1)
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "Filter stage '%s' in '%s' must be CODE,a,b,c",
                              stage.c_str(), text.c_str());

    FilterStage fs;
    fs.code = tokens[0][0];
    if(fs.code != 'M' && fs.code != 'E' && fs.code != 'G')
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "Unknown filter code '%c' in '%s'", fs.code, text.c_str());

    for(int k = 0; k < 3; k++)
      {
      char *end;
      fs.param[k] = strtod(tokens[k+1].c_str(), &end);
      if(*end || tokens[k+1].empty() || fs.param[k] < 0)
        throw AtlasRegException(AtlasRegException::InvalidSpec,
                                "Bad filter parameter '%s' in '%s'",
                                tokens[k+1].c_str(), text.c_str());

      if(fs.code == 'G' && fs.param[k] <= 0)
        throw AtlasRegException(AtlasRegException::InvalidSpec,
                                "Gaussian sigma must be positive in '%s'", text.c_str());

      // Median and mean take integer radii
      if(fs.code != 'G' && fs.param[k] != (int) fs.param[k])
        throw AtlasRegException(AtlasRegException::InvalidSpec,
                                "Filter '%c' needs an integer radius, got '%s'",
                                fs.code, tokens[k+1].c_str());
      }

    m_Stages.push_back(fs);
    }
}

template <typename TReal>
typename ImageFilterPipeline<TReal>::TImage3D::Pointer
ImageFilterPipeline<TReal>
::Apply(TImage3D *image) const
{
  typename TImage3D::Pointer current = image;
  for(const auto &fs : m_Stages)
    {
    if(fs.code == 'M' || fs.code == 'E')
      {
      typename TImage3D::SizeType radius;
      for(int k = 0; k < 3; k++)
        radius[k] = (itk::SizeValueType) fs.param[k];

      if(fs.code == 'M')
        {
        typedef itk::MedianImageFilter<TImage3D, TImage3D> MedianFilter;
        typename MedianFilter::Pointer flt = MedianFilter::New();
        flt->SetInput(current);
        flt->SetRadius(radius);
        flt->Update();
        current = flt->GetOutput();
        }
      else
        {
        typedef itk::MeanImageFilter<TImage3D, TImage3D> MeanFilter;
        typename MeanFilter::Pointer flt = MeanFilter::New();
        flt->SetInput(current);
        flt->SetRadius(radius);
        flt->Update();
        current = flt->GetOutput();
        }
      }
    else
      {
      typedef itk::SmoothingRecursiveGaussianImageFilter<TImage3D, TImage3D> GaussianFilter;
      typename GaussianFilter::Pointer flt = GaussianFilter::New();
      typename GaussianFilter::SigmaArrayType sigma;

      // Sigma is in voxels, the filter works in physical units
      for(int k = 0; k < 3; k++)
        sigma[k] = fs.param[k] * current->GetSpacing()[k];

      flt->SetInput(current);
      flt->SetSigmaArray(sigma);
      flt->Update();
      current = flt->GetOutput();
      }

    // Detach from the pipeline so the next stage starts from a plain image
    current->DisconnectPipeline();
    }

  return current;
}

} // namespace atlasreg
