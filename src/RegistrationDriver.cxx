#include "RegistrationDriver.h"
#include "AtlasRegException.h"
#include <sstream>

namespace atlasreg
{

// Last lines of an engine log, used as the cause of a failure
static std::string log_tail(const std::string &log, unsigned int n_lines)
{
  std::vector<std::string> lines;
  std::istringstream iss(log);
  std::string line;
  while(std::getline(iss, line))
    lines.push_back(line);

  std::string tail;
  size_t first = lines.size() > n_lines ? lines.size() - n_lines : 0;
  for(size_t i = first; i < lines.size(); i++)
    tail += lines[i] + (i + 1 < lines.size() ? "\n" : "");
  return tail;
}

template <typename TReal>
RegistrationDriver<TReal>
::RegistrationDriver(RegistrationEngine<TReal> *engine, AtlasRegStdOut *out)
  : m_Engine(engine), m_StdOut(out ? out : &m_DefaultStdOut),
    m_DefaultStdOut(AtlasRegStdOut::VERB_NONE)
{
}

template <typename TReal>
typename RegistrationDriver<TReal>::ResultType
RegistrationDriver<TReal>
::Run(const RegistrationStep &step, TImage3D *fixed, TImage3D *moving)
{
  ResultType result;
  result.step = step.index;
  result.moving_id = step.moving.id;
  result.fixed_id = step.fixed.id;
  result.fixed_working = ImageGeometry::FromImage(fixed);
  result.moving_working = ImageGeometry::FromImage(moving);
  result.scale_fixed.Fill(1.0);
  result.scale_moving.Fill(1.0);

  for(const auto &tmpl : step.templates)
    {
    m_StdOut->printf("-- [AtlasReg] step %d: %s pass '%s' (%s -> %s)\n",
                     step.index, TransformTemplate::GetTypeName(tmpl.type), tmpl.name.c_str(),
                     step.moving.id.c_str(), step.fixed.id.c_str());

    bool want_inverse = step.WantsInverse() && tmpl.invertible;
    LegType leg;
    std::string log;
    int rc;
    try
      {
      rc = m_Engine->Register(fixed, moving, tmpl, result.legs, want_inverse, leg, log);
      }
    catch(std::exception &exc)
      {
      result.log += log;
      throw AtlasRegException(AtlasRegException::RegistrationFailed,
                              "engine raised an error in pass '%s'", tmpl.name.c_str())
          .SetStep(step.index).SetSpec(step.moving.id, step.fixed.id).SetCause(exc.what());
      }

    result.log += log;
    m_StdOut->print_verbose("%s\n", log.c_str());

    if(rc != 0)
      throw AtlasRegException(AtlasRegException::RegistrationFailed,
                              "engine returned status %d in pass '%s'", rc, tmpl.name.c_str())
          .SetStep(step.index).SetSpec(step.moving.id, step.fixed.id).SetCause(log_tail(log, 10));

    leg.template_name = tmpl.name;
    leg.invertible = tmpl.invertible;

    // An affine result already contains the transform it was seeded with
    if(leg.kind == LegType::AFFINE)
      result.legs.clear();
    result.legs.push_back(leg);
    }

  return result;
}

template class RegistrationDriver<float>;
template class RegistrationDriver<double>;

} // namespace atlasreg
