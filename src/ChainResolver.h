#ifndef CHAINRESOLVER_H
#define CHAINRESOLVER_H

#include "AtlasSpec.h"
#include <vector>
#include <string>

namespace atlasreg
{

/**
 * One pairwise registration of a chain. The moving side is the sample (first
 * step) or the previous step's fixed atlas, the fixed side is the atlas being
 * registered into. Templates, downsampling and prefilter come from the fixed
 * side atlas.
 */
struct RegistrationStep
{
  unsigned int index = 0;
  AtlasSpec moving;
  AtlasSpec fixed;
  std::vector<TransformTemplate> templates;

  double downsampling = 1.0;
  bool downsampling_auto = false;

  int directions = DIR_BOTH;

  bool WantsForward() const { return (directions & DIR_FORWARD) != 0; }
  bool WantsInverse() const { return (directions & DIR_INVERSE) != 0; }
};

/**
 * Ordered steps from the sample to the final atlas. Stored in registration
 * order; reverse iteration gives the atlas-to-sample order used for inverse
 * composition.
 */
class RegistrationChain
{
public:
  typedef std::vector<RegistrationStep>::const_iterator const_iterator;
  typedef std::vector<RegistrationStep>::const_reverse_iterator const_reverse_iterator;

  const_iterator begin() const { return m_Steps.begin(); }
  const_iterator end() const { return m_Steps.end(); }
  const_reverse_iterator rbegin() const { return m_Steps.rbegin(); }
  const_reverse_iterator rend() const { return m_Steps.rend(); }

  size_t size() const { return m_Steps.size(); }
  bool empty() const { return m_Steps.empty(); }
  const RegistrationStep &operator[](size_t i) const { return m_Steps.at(i); }

  /** The sample's source spec, moving side of the first step */
  const AtlasSpec &GetSource() const { return m_Steps.front().moving; }

  /** The final atlas, fixed side of the last step */
  const AtlasSpec &GetFinalTarget() const { return m_Steps.back().fixed; }

  /** Forward (inverse) outputs can be produced only if every step asks for them */
  bool IsForwardRequested() const;
  bool IsInverseRequested() const;

  /** Multi-line listing of the steps for logs */
  std::string Describe() const;

  friend class ChainResolver;

private:
  std::vector<RegistrationStep> m_Steps;
};

class ChainResolver
{
public:
  /**
   * Build the chain from the sample to the root of its target's ancestry.
   * Throws EmptyChain if the target is missing or degenerate, CyclicChain if
   * the ancestry loops, InvalidSpec if a step cannot be configured.
   */
  static RegistrationChain Resolve(const SampleSpec &sample,
                                   const AtlasSpecRegistry &registry,
                                   const TransformTemplateMap &templates);
};

} // namespace atlasreg

#endif // CHAINRESOLVER_H
