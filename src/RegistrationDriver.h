#ifndef REGISTRATIONDRIVER_H
#define REGISTRATIONDRIVER_H

#include "RegistrationEngine.h"
#include "ChainResolver.h"
#include "AtlasRegStdOut.h"

namespace atlasreg
{

/**
 * Runs the registration passes of one chain step through the engine. Passes
 * run in template order, each seeded with the transform found so far: an
 * affine pass replaces the current transform, a deformable pass is appended
 * to it. Any engine failure aborts the step with RegistrationFailed; there is
 * no retry.
 */
template <typename TReal>
class RegistrationDriver
{
public:
  ATLASREG_TYPEDEFS
  typedef TransformLeg<TReal> LegType;
  typedef TransformResult<TReal> ResultType;

  RegistrationDriver(RegistrationEngine<TReal> *engine, AtlasRegStdOut *out = nullptr);
  RegistrationDriver(const RegistrationDriver &) = delete;
  RegistrationDriver &operator=(const RegistrationDriver &) = delete;

  ResultType Run(const RegistrationStep &step, TImage3D *fixed, TImage3D *moving);

private:
  RegistrationEngine<TReal> *m_Engine;
  AtlasRegStdOut *m_StdOut;
  AtlasRegStdOut m_DefaultStdOut;
};

} // namespace atlasreg

#endif // REGISTRATIONDRIVER_H
