#ifndef TRANSFORMCOMPOSER_H
#define TRANSFORMCOMPOSER_H

#include "RegistrationEngine.h"
#include <vector>
#include <string>

namespace atlasreg
{

enum ComposeDirection { COMPOSE_FORWARD = 0, COMPOSE_INVERSE };

enum ResolutionVariant { VARIANT_WORKING = 0, VARIANT_FULL };

/**
 * End-to-end mapping over a whole chain. Like every transform used for
 * resampling, it maps points of the reference grid (where output images live)
 * to points of the source grid (where input images live). For the forward
 * direction the reference is the final atlas and the source is the sample;
 * the inverse direction swaps them.
 */
template <typename TReal>
class ComposedTransform
{
public:
  ATLASREG_TYPEDEFS

  /** Description of one component, in the order added to the composite */
  struct Component
  {
    unsigned int step;
    std::string template_name;
    typename TransformLeg<TReal>::Kind kind;
    bool inverted;
  };

  ComposeDirection direction = COMPOSE_FORWARD;
  ResolutionVariant variant = VARIANT_WORKING;

  ImageGeometry reference;
  ImageGeometry source;

  std::vector<Component> components;

  // ITK applies the last added component first
  typename TCompositeTransform::Pointer transform;

  const TTransformBase *GetTransform() const { return transform.GetPointer(); }

  TPoint TransformPoint(const TPoint &p) const { return transform->TransformPoint(p); }
};

template <typename TReal>
class TransformComposer
{
public:
  ATLASREG_TYPEDEFS
  typedef TransformLeg<TReal> LegType;
  typedef TransformResult<TReal> ResultType;
  typedef std::vector<ResultType> ResultList;
  typedef ComposedTransform<TReal> ComposedType;

  /**
   * Concatenate the step transforms in sample-to-atlas order. The result
   * pulls atlas points back to the sample, and resamples sample images into
   * the final atlas.
   */
  static ComposedType ComposeForward(const ResultList &results, ResolutionVariant variant);

  /**
   * Concatenate the step inverses in atlas-to-sample order. Throws
   * NoInverseAvailable naming the first step that has no inverse.
   */
  static ComposedType ComposeInverse(const ResultList &results, ResolutionVariant variant);

  /** Full resolution grids of a step, from its working grids and scales */
  static ImageGeometry GetFixedGrid(const ResultType &result, ResolutionVariant variant);
  static ImageGeometry GetMovingGrid(const ResultType &result, ResolutionVariant variant);

private:
  static void CheckContinuity(const ResultList &results);

  static typename TTransformBase::Pointer MakeLegTransform(
      const ResultType &result, const LegType &leg, bool inverse, ResolutionVariant variant);
};

} // namespace atlasreg

#endif // TRANSFORMCOMPOSER_H
