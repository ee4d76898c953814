#include "TransformIO.h"
#include "AtlasRegException.h"
#include <itksys/SystemTools.hxx>
#include <fstream>
#include <cstdio>

namespace atlasreg
{

static const char *kind_name(int kind)
{
  return kind == 0 ? "affine" : "deformable";
}

template <typename TReal>
TransformIO<TReal>
::TransformIO(const std::string &directory, AtlasRegStdOut *out)
  : m_Directory(directory)
{
  m_StdOut = out ? out : &m_DefaultStdOut;

  if(!itksys::SystemTools::MakeDirectory(m_Directory))
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Unable to create transform directory %s", m_Directory.c_str());

  std::string fn = this->GetManifestFile();
  if(!itksys::SystemTools::FileExists(fn))
    return;

  // A manifest that cannot be read only disables reuse
  try
    {
    YAML::Node doc = YAML::LoadFile(fn);
    const YAML::Node &steps = doc["steps"];
    if(steps.IsSequence())
      for(YAML::const_iterator it = steps.begin(); it != steps.end(); ++it)
        m_Entries.insert(std::make_pair((*it)["index"].as<unsigned int>(), YAML::Clone(*it)));
    }
  catch(YAML::Exception &exc)
    {
    m_Entries.clear();
    m_StdOut->printf("-- [AtlasReg] ignoring unreadable manifest %s: %s\n", fn.c_str(), exc.what());
    }
}

template <typename TReal>
std::string
TransformIO<TReal>
::GetManifestFile() const
{
  return m_Directory + "/chain.yaml";
}

template <typename TReal>
std::string
TransformIO<TReal>
::GetLegFileName(unsigned int step, const std::string &tmpl, typename LegType::Kind kind, bool inverse)
{
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "step_%02d_", step);
  std::string fn = buffer + tmpl;
  if(kind == LegType::AFFINE)
    return fn + ".mat";
  return fn + (inverse ? "_inverse_warp.nii.gz" : "_warp.nii.gz");
}

template <typename TReal>
YAML::Node
TransformIO<TReal>
::GeometryToYAML(const ImageGeometry &geom)
{
  YAML::Node node;
  for(unsigned int i = 0; i < 3; i++)
    {
    node["size"].push_back((unsigned long) geom.size[i]);
    node["spacing"].push_back(geom.spacing[i]);
    node["origin"].push_back(geom.origin[i]);
    }
  for(unsigned int r = 0; r < 3; r++)
    for(unsigned int c = 0; c < 3; c++)
      node["direction"].push_back(geom.direction(r, c));
  node["size"].SetStyle(YAML::EmitterStyle::Flow);
  node["spacing"].SetStyle(YAML::EmitterStyle::Flow);
  node["origin"].SetStyle(YAML::EmitterStyle::Flow);
  node["direction"].SetStyle(YAML::EmitterStyle::Flow);
  return node;
}

template <typename TReal>
ImageGeometry
TransformIO<TReal>
::GeometryFromYAML(const YAML::Node &node)
{
  ImageGeometry geom;
  for(unsigned int i = 0; i < 3; i++)
    {
    geom.size[i] = node["size"][i].as<unsigned long>();
    geom.spacing[i] = node["spacing"][i].as<double>();
    geom.origin[i] = node["origin"][i].as<double>();
    }
  for(unsigned int r = 0; r < 3; r++)
    for(unsigned int c = 0; c < 3; c++)
      geom.direction(r, c) = node["direction"][r * 3 + c].as<double>();
  return geom;
}

template <typename TReal>
void
TransformIO<TReal>
::Save(const ResultType &result, const std::vector<std::string> &template_names)
{
  YAML::Node entry;
  entry["index"] = result.step;
  entry["moving"] = result.moving_id;
  entry["fixed"] = result.fixed_id;
  for(const auto &name : template_names)
    entry["templates"].push_back(name);
  entry["templates"].SetStyle(YAML::EmitterStyle::Flow);
  entry["fixed-working"] = GeometryToYAML(result.fixed_working);
  entry["moving-working"] = GeometryToYAML(result.moving_working);
  for(unsigned int i = 0; i < 3; i++)
    {
    entry["scale-fixed"].push_back(result.scale_fixed[i]);
    entry["scale-moving"].push_back(result.scale_moving[i]);
    }
  entry["scale-fixed"].SetStyle(YAML::EmitterStyle::Flow);
  entry["scale-moving"].SetStyle(YAML::EmitterStyle::Flow);

  for(const auto &leg : result.legs)
    {
    std::string fn = GetLegFileName(result.step, leg.template_name, leg.kind, false);
    YAML::Node yleg;
    yleg["kind"] = kind_name(leg.kind);
    yleg["template"] = leg.template_name;
    yleg["invertible"] = leg.invertible;
    yleg["file"] = fn;

    if(leg.kind == LegType::AFFINE)
      {
      AtlasRegTools<TReal>::WriteAffineMatrix(leg.affine, m_Directory + "/" + fn);
      }
    else
      {
      AtlasRegTools<TReal>::template WriteImage<TDisplacementField>(leg.warp, m_Directory + "/" + fn);
      if(leg.inverse_warp.IsNotNull())
        {
        std::string fn_inv = GetLegFileName(result.step, leg.template_name, leg.kind, true);
        AtlasRegTools<TReal>::template WriteImage<TDisplacementField>(leg.inverse_warp, m_Directory + "/" + fn_inv);
        yleg["inverse-file"] = fn_inv;
        }
      }

    entry["legs"].push_back(yleg);
    }

  m_Entries.erase(result.step);
  m_Entries.insert(std::make_pair(result.step, entry));
  this->WriteManifest();

  m_StdOut->printf("-- [AtlasReg] step %d transforms saved to %s\n", result.step, m_Directory.c_str());
}

template <typename TReal>
void
TransformIO<TReal>
::WriteManifest() const
{
  YAML::Node doc;
  doc["steps"] = YAML::Node(YAML::NodeType::Sequence);
  for(const auto &it : m_Entries)
    doc["steps"].push_back(it.second);

  std::string fn = this->GetManifestFile();
  std::ofstream out(fn.c_str());
  if(!out)
    throw AtlasRegException(AtlasRegException::InvalidSpec, "Cannot write manifest %s", fn.c_str());
  out << doc << std::endl;
}

template <typename TReal>
bool
TransformIO<TReal>
::IsInvertibleTemplate(const RegistrationStep &step, const std::string &name)
{
  for(const auto &tmpl : step.templates)
    if(tmpl.name == name)
      return tmpl.invertible;
  return false;
}

template <typename TReal>
bool
TransformIO<TReal>
::Load(const RegistrationStep &step,
       const ImageGeometry &fixed_working, const ImageGeometry &moving_working,
       double tolerance, ResultType &result) const
{
  auto it = m_Entries.find(step.index);
  if(it == m_Entries.end())
    return false;

  const YAML::Node &entry = it->second;
  try
    {
    if(entry["moving"].as<std::string>() != step.moving.id
       || entry["fixed"].as<std::string>() != step.fixed.id)
      return false;

    const YAML::Node &templates = entry["templates"];
    if(!templates.IsSequence() || templates.size() != step.templates.size())
      return false;
    for(size_t i = 0; i < templates.size(); i++)
      if(templates[i].as<std::string>() != step.templates[i].name)
        return false;

    const YAML::Node &legs = entry["legs"];
    if(!legs.IsSequence())
      return false;

    ImageGeometry gf = GeometryFromYAML(entry["fixed-working"]);
    ImageGeometry gm = GeometryFromYAML(entry["moving-working"]);
    if(!gf.IsSameGrid(fixed_working, tolerance) || !gm.IsSameGrid(moving_working, tolerance))
      {
      m_StdOut->printf("-- [AtlasReg] step %d: saved transforms were registered on other grids\n", step.index);
      return false;
      }

    for(size_t i = 0; i < legs.size(); i++)
      {
      if(!itksys::SystemTools::FileExists(m_Directory + "/" + legs[i]["file"].as<std::string>()))
        return false;
      if(legs[i]["inverse-file"]
         && !itksys::SystemTools::FileExists(m_Directory + "/" + legs[i]["inverse-file"].as<std::string>()))
        return false;

      // A step that needs its inverse cannot reuse deformable legs saved without one
      if(step.WantsInverse() && !legs[i]["inverse-file"]
         && legs[i]["kind"].as<std::string>() == kind_name(LegType::DEFORMABLE)
         && IsInvertibleTemplate(step, legs[i]["template"].as<std::string>()))
        {
        m_StdOut->printf("-- [AtlasReg] step %d: saved transforms have no inverse for '%s'\n",
                         step.index, legs[i]["template"].as<std::string>().c_str());
        return false;
        }
      }

    ResultType res;
    res.step = step.index;
    res.moving_id = step.moving.id;
    res.fixed_id = step.fixed.id;
    res.fixed_working = gf;
    res.moving_working = gm;
    for(unsigned int i = 0; i < 3; i++)
      {
      res.scale_fixed[i] = entry["scale-fixed"][i].as<double>();
      res.scale_moving[i] = entry["scale-moving"][i].as<double>();
      }

    for(size_t i = 0; i < legs.size(); i++)
      {
      const YAML::Node &yleg = legs[i];
      LegType leg;
      leg.template_name = yleg["template"].as<std::string>();
      leg.invertible = yleg["invertible"].as<bool>();
      std::string fn = m_Directory + "/" + yleg["file"].as<std::string>();
      if(yleg["kind"].as<std::string>() == kind_name(LegType::AFFINE))
        {
        leg.kind = LegType::AFFINE;
        leg.affine = AtlasRegTools<TReal>::ReadAffineMatrix(fn);
        }
      else
        {
        leg.kind = LegType::DEFORMABLE;
        leg.warp = AtlasRegTools<TReal>::ReadDisplacementField(fn);
        if(yleg["inverse-file"])
          leg.inverse_warp = AtlasRegTools<TReal>::ReadDisplacementField(
                m_Directory + "/" + yleg["inverse-file"].as<std::string>());
        }
      res.legs.push_back(leg);
      }

    res.reused = true;
    res.log = "reused transforms from " + this->GetManifestFile() + "\n";
    result = res;
    }
  catch(YAML::Exception &exc)
    {
    m_StdOut->printf("-- [AtlasReg] step %d: manifest entry is unusable (%s)\n", step.index, exc.what());
    return false;
    }

  m_StdOut->printf("-- [AtlasReg] step %d: reusing saved transforms\n", step.index);
  return true;
}

template <typename TReal>
void
TransformIO<TReal>
::WriteComposed(const std::vector<const ComposedType *> &composed, const std::string &filename) const
{
  YAML::Node doc;
  for(const ComposedType *ct : composed)
    {
    YAML::Node node;
    node["variant"] = ct->variant == VARIANT_FULL ? "full" : "working";
    node["reference"] = GeometryToYAML(ct->reference);
    node["source"] = GeometryToYAML(ct->source);

    // The composite applies its last component first
    for(auto it = ct->components.rbegin(); it != ct->components.rend(); ++it)
      {
      YAML::Node yc;
      yc["step"] = it->step;
      yc["template"] = it->template_name;
      yc["kind"] = kind_name(it->kind);
      yc["inverted"] = it->inverted;
      if(it->kind == LegType::AFFINE)
        yc["file"] = GetLegFileName(it->step, it->template_name, it->kind, false);
      else
        yc["file"] = GetLegFileName(it->step, it->template_name, it->kind, it->inverted);
      node["components"].push_back(yc);
      }

    doc[ct->direction == COMPOSE_FORWARD ? "forward" : "inverse"] = node;
    }

  std::ofstream out(filename.c_str());
  if(!out)
    throw AtlasRegException(AtlasRegException::InvalidSpec, "Cannot write %s", filename.c_str());
  out << doc << std::endl;
}

template class TransformIO<float>;
template class TransformIO<double>;

} // namespace atlasreg
