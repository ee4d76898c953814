#include "ChainResolver.h"
#include "AtlasRegException.h"
#include <sstream>

namespace atlasreg
{

bool
RegistrationChain
::IsForwardRequested() const
{
  for(const auto &step : m_Steps)
    if(!step.WantsForward())
      return false;
  return m_Steps.size() > 0;
}

bool
RegistrationChain
::IsInverseRequested() const
{
  for(const auto &step : m_Steps)
    if(!step.WantsInverse())
      return false;
  return m_Steps.size() > 0;
}

std::string
RegistrationChain
::Describe() const
{
  static const char *dir_names[] = { "none", "forward", "inverse", "both" };

  std::ostringstream oss;
  for(const auto &step : m_Steps)
    {
    oss << "  step " << step.index << ": " << step.moving.id << " -> " << step.fixed.id << " [";
    for(size_t k = 0; k < step.templates.size(); k++)
      oss << (k > 0 ? ", " : "") << step.templates[k].name;
    oss << "] downsampling ";
    if(step.downsampling_auto)
      oss << "auto";
    else
      oss << step.downsampling;
    oss << ", directions " << dir_names[step.directions & DIR_BOTH] << "\n";
    }
  return oss.str();
}

RegistrationChain
ChainResolver
::Resolve(const SampleSpec &sample,
          const AtlasSpecRegistry &registry,
          const TransformTemplateMap &templates)
{
  if(!registry.Has(sample.target))
    throw AtlasRegException(AtlasRegException::EmptyChain,
                            "target atlas '%s' is not defined", sample.target.c_str());

  if(sample.source.template_path.empty())
    throw AtlasRegException(AtlasRegException::EmptyChain,
                            "sample has no template to register").SetSpec(sample.source.id);

  const AtlasSpec *current = &registry.Get(sample.target);

  // Walks the whole ancestry, throws CyclicChain on a loop
  const AtlasSpec *parent = registry.ResolveParent(*current);

  if(!parent && current->template_path.empty())
    throw AtlasRegException(AtlasRegException::EmptyChain,
                            "target atlas has no parent and no template").SetSpec(current->id);

  RegistrationChain chain;
  const AtlasSpec *moving = &sample.source;
  while(current)
    {
    RegistrationStep step;
    step.index = (unsigned int) chain.m_Steps.size();
    step.moving = *moving;
    step.fixed = *current;
    step.downsampling = current->downsampling;
    step.downsampling_auto = current->downsampling_auto;
    step.directions = sample.GetDirections(step.index);

    if(current->template_path.empty())
      throw AtlasRegException(AtlasRegException::InvalidSpec, "atlas has no template")
          .SetStep(step.index).SetSpec(moving->id, current->id);

    if(step.directions == DIR_NONE)
      throw AtlasRegException(AtlasRegException::InvalidSpec, "no registration direction requested")
          .SetStep(step.index).SetSpec(moving->id, current->id);

    if(current->transforms.empty())
      throw AtlasRegException(AtlasRegException::InvalidSpec, "atlas lists no transform templates")
          .SetStep(step.index).SetSpec(moving->id, current->id);

    for(const auto &name : current->transforms)
      {
      auto it = templates.find(name);
      if(it == templates.end())
        throw AtlasRegException(AtlasRegException::InvalidSpec,
                                "unknown transform template '%s'", name.c_str())
            .SetStep(step.index).SetSpec(moving->id, current->id);
      step.templates.push_back(it->second);
      }

    // Resolution may only get finer towards the atlas when explicitly configured
    if(current->GetMeanResolution() < moving->GetMeanResolution() && !current->downsampling_explicit)
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "fixed atlas (%g um) is finer than the moving side (%g um); "
                              "set 'downsampling' on the atlas to allow this",
                              current->GetMeanResolution(), moving->GetMeanResolution())
          .SetStep(step.index).SetSpec(moving->id, current->id);

    chain.m_Steps.push_back(step);

    moving = current;
    current = registry.ResolveParent(*current);
    }

  return chain;
}

} // namespace atlasreg
