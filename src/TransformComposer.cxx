#include "TransformComposer.h"
#include "AtlasRegException.h"

namespace atlasreg
{

template <typename TReal>
ImageGeometry
TransformComposer<TReal>
::GetFixedGrid(const ResultType &result, ResolutionVariant variant)
{
  return variant == VARIANT_FULL ? result.fixed_working.Rescaled(result.scale_fixed) : result.fixed_working;
}

template <typename TReal>
ImageGeometry
TransformComposer<TReal>
::GetMovingGrid(const ResultType &result, ResolutionVariant variant)
{
  return variant == VARIANT_FULL ? result.moving_working.Rescaled(result.scale_moving) : result.moving_working;
}

template <typename TReal>
void
TransformComposer<TReal>
::CheckContinuity(const ResultList &results)
{
  if(results.empty())
    throw AtlasRegException(AtlasRegException::EmptyChain, "no step transforms to compose");

  for(size_t i = 1; i < results.size(); i++)
    if(results[i-1].fixed_id != results[i].moving_id)
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "step %d ends in '%s' but step %d starts from '%s'",
                              (int) i - 1, results[i-1].fixed_id.c_str(),
                              (int) i, results[i].moving_id.c_str());
}

template <typename TReal>
typename TransformComposer<TReal>::TTransformBase::Pointer
TransformComposer<TReal>
::MakeLegTransform(const ResultType &result, const LegType &leg, bool inverse, ResolutionVariant variant)
{
  if(leg.kind == LegType::AFFINE)
    {
    if(!inverse)
      return leg.affine.GetPointer();

    typename TAffineTransform::Pointer inv = TAffineTransform::New();
    if(!leg.affine->GetInverse(inv))
      throw AtlasRegException(AtlasRegException::NoInverseAvailable,
                              "affine transform of pass '%s' is singular", leg.template_name.c_str())
          .SetStep(result.step).SetSpec(result.moving_id, result.fixed_id);
    return inv.GetPointer();
    }

  // Both fields live on the fixed working grid. The full resolution variant
  // resamples them, the displacement vectors are physical and stay as they are
  typename TDisplacementField::Pointer field = inverse ? leg.inverse_warp : leg.warp;
  if(variant == VARIANT_FULL)
    {
    ImageGeometry grid = GetFixedGrid(result, variant);
    if(!grid.IsSameGrid(ImageGeometry::FromImage(field), 1.0e-6))
      field = AtlasRegTools<TReal>::ResampleDisplacementField(field, grid);
    }

  typename TWarpTransform::Pointer warp = TWarpTransform::New();
  warp->SetDisplacementField(field);
  return warp.GetPointer();
}

template <typename TReal>
typename TransformComposer<TReal>::ComposedType
TransformComposer<TReal>
::ComposeForward(const ResultList &results, ResolutionVariant variant)
{
  CheckContinuity(results);

  ComposedType ct;
  ct.direction = COMPOSE_FORWARD;
  ct.variant = variant;
  ct.reference = GetFixedGrid(results.back(), variant);
  ct.source = GetMovingGrid(results.front(), variant);
  ct.transform = TCompositeTransform::New();

  // Step 0 is applied last: atlas points are pulled back through the chain
  for(const auto &result : results)
    {
    for(const auto &leg : result.legs)
      {
      ct.transform->AddTransform(MakeLegTransform(result, leg, false, variant));
      ct.components.push_back({ result.step, leg.template_name, leg.kind, false });
      }
    }

  return ct;
}

template <typename TReal>
typename TransformComposer<TReal>::ComposedType
TransformComposer<TReal>
::ComposeInverse(const ResultList &results, ResolutionVariant variant)
{
  CheckContinuity(results);

  // Report the first step, in chain order, that cannot be inverted
  for(const auto &result : results)
    for(const auto &leg : result.legs)
      if(!leg.HasInverse())
        throw AtlasRegException(AtlasRegException::NoInverseAvailable,
                                "pass '%s' (%s) has no inverse", leg.template_name.c_str(),
                                leg.kind == LegType::AFFINE ? "affine" : "deformable")
            .SetStep(result.step).SetSpec(result.moving_id, result.fixed_id);

  ComposedType ct;
  ct.direction = COMPOSE_INVERSE;
  ct.variant = variant;
  ct.reference = GetMovingGrid(results.front(), variant);
  ct.source = GetFixedGrid(results.back(), variant);
  ct.transform = TCompositeTransform::New();

  for(auto it = results.rbegin(); it != results.rend(); ++it)
    {
    for(auto itLeg = it->legs.rbegin(); itLeg != it->legs.rend(); ++itLeg)
      {
      ct.transform->AddTransform(MakeLegTransform(*it, *itLeg, true, variant));
      ct.components.push_back({ it->step, itLeg->template_name, itLeg->kind, true });
      }
    }

  return ct;
}

template class ComposedTransform<float>;
template class ComposedTransform<double>;
template class TransformComposer<float>;
template class TransformComposer<double>;

} // namespace atlasreg
