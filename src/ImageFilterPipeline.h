#ifndef IMAGEFILTERPIPELINE_H
#define IMAGEFILTERPIPELINE_H

#include "AtlasRegCommon.h"
#include <string>
#include <vector>

namespace atlasreg
{

/**
 * Sequence of smoothing filters applied to a working image before it is
 * passed to the registration engine. Described by a string of stages joined
 * by '-', each stage a filter code followed by three per-axis parameters:
 *
 *   M,rx,ry,rz   median filter with the given radius in voxels
 *   E,rx,ry,rz   mean filter with the given radius in voxels
 *   G,sx,sy,sz   recursive Gaussian with the given sigma in voxels
 *
 * e.g. "M,1,1,1-G,0.5,0.5,0.5"
 */
template <typename TReal>
class ImageFilterPipeline
{
public:
  ATLASREG_TYPEDEFS

  struct FilterStage
  {
    char code;
    double param[3];
  };

  /** Parse the pipeline, throws InvalidSpec on malformed input */
  ImageFilterPipeline(const std::string &text);

  const std::vector<FilterStage> &GetStages() const { return m_Stages; }

  bool IsEmpty() const { return m_Stages.empty(); }

  /** Run all stages in order. The input image is not modified */
  typename TImage3D::Pointer Apply(TImage3D *image) const;

private:
  std::vector<FilterStage> m_Stages;
  std::string m_Text;
};

} // namespace atlasreg

#include "ImageFilterPipeline.txx"

#endif // IMAGEFILTERPIPELINE_H
