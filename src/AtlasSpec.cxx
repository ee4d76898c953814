#include "AtlasSpec.h"
#include "AtlasRegException.h"
#include "ImageFilterPipeline.h"

#include <yaml-cpp/yaml.h>
#include <itksys/SystemTools.hxx>
#include <set>
#include <sstream>
#include <fstream>
#include <cmath>

namespace atlasreg
{

// Identity reserved for the sample's own template
static const char *SAMPLE_ID = "sample";

double
AtlasSpec
::GetMeanResolution() const
{
  if(resolution.empty())
    return 0.0;

  double sum = 0.0;
  for(double r : resolution)
    sum += r;
  return sum / resolution.size();
}

const char *
TransformTemplate
::GetTypeName(Type type)
{
  switch(type)
    {
    case AFFINE: return "affine";
    case DEFORMABLE: return "deformable";
    default: return "invalid";
    }
}

int
SampleSpec
::GetDirections(unsigned int step) const
{
  if(directions.size() == 1)
    return directions[0];
  if(step < directions.size())
    return directions[step];
  return DIR_NONE;
}

//==================================================
// AtlasSpecRegistry
//==================================================

void
AtlasSpecRegistry
::Add(const AtlasSpec &spec)
{
  if(Has(spec.id))
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Atlas '%s' is defined more than once", spec.id.c_str());

  m_Index[spec.id] = m_Specs.size();
  m_Specs.push_back(spec);
}

const AtlasSpec &
AtlasSpecRegistry
::Get(const std::string &id) const
{
  return m_Specs[GetIndex(id)];
}

size_t
AtlasSpecRegistry
::GetIndex(const std::string &id) const
{
  auto it = m_Index.find(id);
  if(it == m_Index.end())
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Atlas '%s' is not defined", id.c_str());
  return it->second;
}

const AtlasSpec *
AtlasSpecRegistry
::ResolveParent(const AtlasSpec &spec) const
{
  if(!spec.HasParent())
    return nullptr;

  std::set<std::string> visited;
  visited.insert(spec.id);

  const AtlasSpec *parent = nullptr;
  const AtlasSpec *current = &spec;
  while(current->HasParent())
    {
    if(!Has(current->parent))
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "parent '%s' of atlas '%s' is not defined",
                              current->parent.c_str(), current->id.c_str()).SetSpec(spec.id);

    const AtlasSpec *next = &Get(current->parent);
    if(visited.count(next->id))
      throw AtlasRegException(AtlasRegException::CyclicChain,
                              "parent chain of atlas '%s' revisits '%s'",
                              spec.id.c_str(), next->id.c_str()).SetSpec(spec.id);

    visited.insert(next->id);
    if(!parent)
      parent = next;
    current = next;
    }

  return parent;
}

//==================================================
// Validation
//==================================================

namespace
{

std::string format_violation(const AtlasSpec &spec, const std::string &text)
{
  return "atlas '" + spec.id + "': " + text;
}

bool check_orientation(const std::string &code)
{
  std::vector<std::string> tokens;
  std::istringstream iss(code);
  std::string tok;
  while(std::getline(iss, tok, ':'))
    tokens.push_back(tok);

  if(tokens.size() != 3)
    return false;

  // Each axis pair must appear exactly once
  const char *pairs[3][2] = { {"LR", "RL"}, {"SI", "IS"}, {"AP", "PA"} };
  int count[3] = {0, 0, 0};
  for(const auto &t : tokens)
    {
    bool found = false;
    for(int k = 0; k < 3; k++)
      if(t == pairs[k][0] || t == pairs[k][1])
        {
        count[k]++;
        found = true;
        }
    if(!found)
      return false;
    }

  return count[0] == 1 && count[1] == 1 && count[2] == 1;
}

void check_template(const TransformTemplate &tt, std::vector<SpecViolation> &violations)
{
  std::string prefix = "template '" + tt.name + "': ";
  if(tt.type == TransformTemplate::INVALID)
    violations.push_back({prefix + "type must be 'affine' or 'deformable'", false});

  if(tt.type == TransformTemplate::AFFINE && tt.dof != 6 && tt.dof != 7 && tt.dof != 12)
    violations.push_back({prefix + "dof must be 6, 7 or 12", false});

  static const std::set<std::string> metrics { "NCC", "WNCC", "NMI", "MI", "SSD" };
  if(!metrics.count(tt.metric))
    violations.push_back({prefix + "unknown metric '" + tt.metric + "'", false});

  if(tt.metric == "NCC" || tt.metric == "WNCC")
    {
    bool ok = tt.metric_radius.size() == 3;
    for(int r : tt.metric_radius)
      ok = ok && r > 0;
    if(!ok)
      violations.push_back({prefix + "metric-radius must have 3 positive entries", false});
    }

  bool iter_ok = tt.iterations.size() > 0;
  for(int n : tt.iterations)
    iter_ok = iter_ok && n >= 0;
  if(!iter_ok)
    violations.push_back({prefix + "iterations must be a non-empty list of non-negative integers", false});
}

} // anonymous namespace

void CheckAtlasSpec(const AtlasSpec &spec,
                    const AtlasSpecRegistry &registry,
                    const TransformTemplateMap &templates,
                    std::vector<SpecViolation> &violations)
{
  if(spec.template_path.empty())
    violations.push_back({format_violation(spec, "template-path is missing"), false});

  bool res_ok = spec.resolution.size() == 3;
  for(double r : spec.resolution)
    res_ok = res_ok && r > 0.0;
  if(!res_ok)
    violations.push_back({format_violation(spec, "resolution must have 3 positive components"), false});

  bool size_ok = spec.size.size() == 3;
  for(long s : spec.size)
    size_ok = size_ok && s > 0;
  if(!size_ok)
    violations.push_back({format_violation(spec, "size must have 3 positive components"), false});

  if(!check_orientation(spec.orientation))
    violations.push_back({format_violation(
        spec, "orientation '" + spec.orientation + "' must have one token from each of LR/RL, SI/IS, AP/PA"), false});

  if(spec.structure_tree_paths.size() && spec.structure_tree_paths.size() != spec.annotation_paths.size())
    violations.push_back({format_violation(
        spec, "structure-tree must list one table per annotation or none"), false});

  for(const auto &rp : spec.reference_points)
    {
    for(unsigned int d = 0; d < 3; d++)
      {
      if(rp.pixel[d] < 0 || (size_ok && rp.pixel[d] >= spec.size[d]))
        {
        violations.push_back({format_violation(
            spec, "reference point '" + rp.name + "' lies outside the image size"), false});
        break;
        }
      }
    }

  if(spec.prefilter.size())
    {
    try
      {
      ImageFilterPipeline<double> pipeline(spec.prefilter);
      }
    catch(AtlasRegException &exc)
      {
      violations.push_back({format_violation(spec, exc.GetMessage()), false});
      }
    }

  if(spec.downsampling_auto == false && !(spec.downsampling >= 1.0))
    violations.push_back({format_violation(spec, "downsampling must be 'auto' or a number >= 1"), false});

  // Transform templates, affine passes may not follow a deformable pass
  bool seen_deformable = false;
  for(const auto &name : spec.transforms)
    {
    auto it = templates.find(name);
    if(it == templates.end())
      {
      violations.push_back({format_violation(spec, "unknown transform template '" + name + "'"), false});
      continue;
      }

    if(it->second.type == TransformTemplate::DEFORMABLE)
      seen_deformable = true;
    else if(it->second.type == TransformTemplate::AFFINE && seen_deformable)
      violations.push_back({format_violation(
          spec, "affine template '" + name + "' follows a deformable template"), false});
    }

  // Parent must exist and must not lead back into the walk
  if(spec.HasParent())
    {
    try
      {
      registry.ResolveParent(spec);
      }
    catch(AtlasRegException &exc)
      {
      violations.push_back({format_violation(spec, exc.GetMessage()),
                            exc.GetType() == AtlasRegException::CyclicChain});
      }
    }
}

void CheckAtlasSpecFiles(const AtlasSpec &spec, std::vector<SpecViolation> &violations)
{
  auto check = [&spec, &violations](const std::string &fn, const char *what) {
    if(fn.size() && !itksys::SystemTools::FileExists(fn.c_str(), true))
      violations.push_back({format_violation(spec, std::string(what) + " '" + fn + "' does not exist"), false});
  };

  check(spec.template_path, "template-path");
  for(const auto &fn : spec.annotation_paths)
    check(fn, "annotations-path");
  for(const auto &fn : spec.structure_tree_paths)
    check(fn, "structure-tree");
}

void ThrowIfViolations(const std::vector<SpecViolation> &violations, const char *what)
{
  if(violations.empty())
    return;

  bool cyclic = false;
  std::vector<std::string> messages;
  for(const auto &v : violations)
    {
    cyclic = cyclic || v.cyclic;
    messages.push_back(v.message);
    }

  throw AtlasRegException(cyclic ? AtlasRegException::CyclicChain : AtlasRegException::InvalidSpec,
                          "%d violation(s) found in %s", (int) violations.size(), what)
      .SetViolations(messages);
}

void ValidateAtlasSpec(const AtlasSpec &spec,
                       const AtlasSpecRegistry &registry,
                       const TransformTemplateMap &templates)
{
  std::vector<SpecViolation> violations;
  CheckAtlasSpec(spec, registry, templates, violations);
  ThrowIfViolations(violations, ("atlas " + spec.id).c_str());
}

//==================================================
// AtlasRegConfiguration
//==================================================

namespace
{

typedef std::map<std::string, YAML::Node> KeyMap;

/**
 * Map document keys to their plain names. Standalone atlas parameter files
 * prefix every key with 'target-', 'ccf-' or 'source-', and name some keys
 * 'template-resolution', 'template-size' and so on.
 */
KeyMap normalize_keys(const YAML::Node &node)
{
  static const char *prefixes[] = { "target-", "ccf-", "source-" };
  static const std::set<std::string> template_keys {
    "resolution", "size", "reference", "structure", "orientation" };

  KeyMap keys;
  for(YAML::const_iterator it = node.begin(); it != node.end(); ++it)
    {
    std::string key = it->first.as<std::string>();
    for(const char *p : prefixes)
      {
      std::string ps(p);
      if(key.compare(0, ps.size(), ps) == 0)
        {
        key = key.substr(ps.size());
        break;
        }
      }

    if(key.compare(0, 9, "template-") == 0 && template_keys.count(key.substr(9)))
      key = key.substr(9);

    keys.insert(std::make_pair(key, it->second));
    }
  return keys;
}

const YAML::Node *find_key(const KeyMap &keys, const std::string &key)
{
  auto it = keys.find(key);
  return it == keys.end() ? nullptr : &it->second;
}

std::string resolve_path(const std::string &path, const std::string &base_dir)
{
  if(path.empty())
    return path;
  return itksys::SystemTools::CollapseFullPath(path, base_dir);
}

std::vector<std::string> read_path_list(const YAML::Node *node, const std::string &base_dir)
{
  std::vector<std::string> paths;
  if(!node || node->IsNull())
    return paths;

  if(node->IsScalar())
    paths.push_back(resolve_path(node->as<std::string>(), base_dir));
  else
    for(const auto &n : *node)
      paths.push_back(resolve_path(n.as<std::string>(), base_dir));
  return paths;
}

/** Read a per-axis triple given as a sequence or as a map with the given keys */
template <typename T>
std::vector<T> read_triple(const YAML::Node *pnode, const char *kx, const char *ky, const char *kz)
{
  std::vector<T> out;
  if(!pnode || pnode->IsNull())
    return out;

  const YAML::Node &node = *pnode;
  if(node.IsSequence())
    {
    for(const auto &n : node)
      out.push_back(n.as<T>());
    }
  else if(node.IsMap())
    {
    const char *keys[] = { kx, ky, kz };
    for(const char *k : keys)
      if(node[k])
        out.push_back(node[k].as<T>());
    }
  else
    {
    out.push_back(node.as<T>());
    }
  return out;
}

int parse_direction(const std::string &s)
{
  if(s == "forward")
    return DIR_FORWARD;
  else if(s == "inverse")
    return DIR_INVERSE;
  else if(s == "both")
    return DIR_BOTH;
  return DIR_NONE;
}

TransformTemplate load_template(const YAML::Node &node, const std::string &name,
                                const TransformTemplate &defaults)
{
  TransformTemplate tt = defaults;
  tt.name = name;

  if(node["type"])
    {
    std::string type = node["type"].as<std::string>();
    if(type == "affine")
      tt.type = TransformTemplate::AFFINE;
    else if(type == "deformable" || type == "bspline")
      tt.type = TransformTemplate::DEFORMABLE;
    else
      tt.type = TransformTemplate::INVALID;
    }

  if(node["dof"]) tt.dof = node["dof"].as<int>();
  if(node["metric"]) tt.metric = node["metric"].as<std::string>();
  if(node["metric-radius"]) tt.metric_radius = node["metric-radius"].as<std::vector<int>>();
  if(node["iterations"]) tt.iterations = node["iterations"].as<std::vector<int>>();
  if(node["invertible"]) tt.invertible = node["invertible"].as<bool>();
  if(node["options"]) tt.options = node["options"].as<std::string>();

  if((tt.metric == "NCC" || tt.metric == "WNCC") && tt.metric_radius.empty())
    tt.metric_radius = { 2, 2, 2 };

  return tt;
}

} // anonymous namespace

void
AtlasRegConfiguration
::SaveAtlasSpec(const AtlasSpec &spec, const std::string &filename)
{
  std::string fn_full = itksys::SystemTools::CollapseFullPath(filename);
  std::string dir = itksys::SystemTools::GetFilenamePath(fn_full);
  auto relative = [&dir](const std::string &path) {
    return itksys::SystemTools::RelativePath(dir, path);
  };

  YAML::Node node;
  node["target-template-path"] = relative(spec.template_path);
  node["target-annotations-path"] = YAML::Node(YAML::NodeType::Sequence);
  for(const auto &fn : spec.annotation_paths)
    node["target-annotations-path"].push_back(relative(fn));
  node["target-structure-tree"] = YAML::Node(YAML::NodeType::Sequence);
  for(const auto &fn : spec.structure_tree_paths)
    node["target-structure-tree"].push_back(relative(fn));

  const char *res_keys[] = { "x-um", "y-um", "z-um" };
  const char *size_keys[] = { "x", "y", "z" };
  for(unsigned int d = 0; d < spec.resolution.size() && d < 3; d++)
    node["target-template-resolution"][res_keys[d]] = spec.resolution[d];
  for(unsigned int d = 0; d < spec.size.size() && d < 3; d++)
    node["target-template-size"][size_keys[d]] = spec.size[d];

  for(const auto &rp : spec.reference_points)
    {
    YAML::Node yp;
    for(unsigned int d = 0; d < 3; d++)
      yp[size_keys[d]] = rp.pixel[d];
    yp.SetStyle(YAML::EmitterStyle::Flow);
    node["target-template-reference"][rp.name] = yp;
    }

  node["target-template-structure"] = spec.structure;
  node["target-template-orientation"] = spec.orientation;

  std::ofstream out(fn_full.c_str());
  if(!out)
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Cannot write atlas parameter file %s", fn_full.c_str()).SetSpec(spec.id);
  out << node << std::endl;
}

TransformTemplateMap
AtlasRegConfiguration
::GetDefaultTemplates()
{
  TransformTemplateMap tm;

  TransformTemplate affine;
  affine.name = "affine";
  affine.type = TransformTemplate::AFFINE;
  affine.dof = 12;
  affine.metric = "NMI";
  tm[affine.name] = affine;

  TransformTemplate bspline;
  bspline.name = "bspline";
  bspline.type = TransformTemplate::DEFORMABLE;
  bspline.metric = "NCC";
  bspline.metric_radius = { 2, 2, 2 };
  bspline.invertible = true;
  tm[bspline.name] = bspline;

  return tm;
}

AtlasSpec
AtlasRegConfiguration
::LoadAtlasSpec(const YAML::Node &node, const std::string &id, const std::string &base_dir)
{
  if(!node.IsMap())
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "atlas definition must be a mapping").SetSpec(id);

  KeyMap keys = normalize_keys(node);
  AtlasSpec spec;
  spec.id = id;

  const YAML::Node *n;
  if((n = find_key(keys, "template-path")))
    spec.template_path = resolve_path(n->as<std::string>(), base_dir);

  spec.annotation_paths = read_path_list(find_key(keys, "annotations-path"), base_dir);
  spec.structure_tree_paths = read_path_list(find_key(keys, "structure-tree"), base_dir);
  spec.resolution = read_triple<double>(find_key(keys, "resolution"), "x-um", "y-um", "z-um");
  spec.size = read_triple<long>(find_key(keys, "size"), "x", "y", "z");

  if((n = find_key(keys, "reference")) && n->IsMap())
    {
    for(YAML::const_iterator it = n->begin(); it != n->end(); ++it)
      {
      ReferencePoint rp;
      rp.name = it->first.as<std::string>();
      std::vector<double> px = read_triple<double>(&it->second, "x", "y", "z");
      if(px.size() != 3)
        throw AtlasRegException(AtlasRegException::InvalidSpec,
                                "reference point '%s' must have x, y and z", rp.name.c_str()).SetSpec(id);
      for(unsigned int d = 0; d < 3; d++)
        rp.pixel[d] = px[d];
      spec.reference_points.push_back(rp);
      }
    }

  if((n = find_key(keys, "structure")))
    spec.structure = n->as<std::string>();

  if((n = find_key(keys, "orientation")))
    spec.orientation = n->as<std::string>();

  if((n = find_key(keys, "parent")))
    spec.parent = n->as<std::string>();

  if((n = find_key(keys, "downsampling")))
    {
    spec.downsampling_explicit = true;
    std::string text = n->as<std::string>();
    if(text == "auto")
      {
      spec.downsampling_auto = true;
      }
    else
      {
      // Left invalid and reported by validation
      char *end;
      double f = strtod(text.c_str(), &end);
      spec.downsampling = (*end || text.empty()) ? 0.0 : f;
      }
    }

  if((n = find_key(keys, "transforms")))
    spec.transforms = n->IsScalar()
                      ? std::vector<std::string>(1, n->as<std::string>())
                      : n->as<std::vector<std::string>>();
  else
    spec.transforms = { "affine", "bspline" };

  if((n = find_key(keys, "prefilter")))
    spec.prefilter = n->as<std::string>();

  return spec;
}

AtlasRegConfiguration
AtlasRegConfiguration
::Load(const std::string &filename)
{
  if(!itksys::SystemTools::FileExists(filename.c_str()))
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Configuration file '%s' not found", filename.c_str());

  std::string base_dir = itksys::SystemTools::GetFilenamePath(
        itksys::SystemTools::CollapseFullPath(filename));

  try
    {
    YAML::Node doc = YAML::LoadFile(filename);
    return FromYAML(doc, base_dir);
    }
  catch(YAML::Exception &exc)
    {
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Unable to read configuration '%s'", filename.c_str()).SetCause(exc.what());
    }
}

AtlasRegConfiguration
AtlasRegConfiguration
::FromYAML(const YAML::Node &doc, const std::string &base_dir)
{
  AtlasRegConfiguration cfg;
  cfg.base_dir = base_dir;

  try
    {
    // Transform templates, user definitions override the built-in ones
    cfg.templates = GetDefaultTemplates();
    const YAML::Node &yt = doc["templates"];
    if(yt)
      {
      for(YAML::const_iterator it = yt.begin(); it != yt.end(); ++it)
        {
        std::string name = it->first.as<std::string>();
        auto itDef = cfg.templates.find(name);
        TransformTemplate defaults = itDef != cfg.templates.end() ? itDef->second : TransformTemplate();
        cfg.templates[name] = load_template(it->second, name, defaults);
        }
      }

    // Atlases may be given inline or as the path of a standalone parameter file
    const YAML::Node &ya = doc["atlases"];
    if(ya)
      {
      for(YAML::const_iterator it = ya.begin(); it != ya.end(); ++it)
        {
        std::string id = it->first.as<std::string>();
        if(it->second.IsScalar())
          {
          std::string fn = resolve_path(it->second.as<std::string>(), base_dir);
          if(!itksys::SystemTools::FileExists(fn.c_str()))
            throw AtlasRegException(AtlasRegException::InvalidSpec,
                                    "atlas parameter file '%s' not found", fn.c_str()).SetSpec(id);

          YAML::Node atlas_doc = YAML::LoadFile(fn);
          cfg.atlases.Add(LoadAtlasSpec(atlas_doc, id, itksys::SystemTools::GetFilenamePath(fn)));
          }
        else
          {
          cfg.atlases.Add(LoadAtlasSpec(it->second, id, base_dir));
          }
        }
      }

    // The sample
    const YAML::Node &ys = doc["sample"];
    if(!ys)
      throw AtlasRegException(AtlasRegException::InvalidSpec,
                              "configuration has no 'sample' section");

    cfg.sample.source = LoadAtlasSpec(ys, SAMPLE_ID, base_dir);
    cfg.sample.source.parent.clear();
    cfg.sample.source.transforms.clear();

    KeyMap skeys = normalize_keys(ys);
    cfg.sample.image_paths = read_path_list(find_key(skeys, "images-path"), base_dir);

    const YAML::Node *n;
    if((n = find_key(skeys, "target")))
      cfg.sample.target = n->as<std::string>();

    if((n = find_key(skeys, "directions")))
      {
      cfg.sample.directions.clear();
      if(n->IsScalar())
        cfg.sample.directions.push_back(parse_direction(n->as<std::string>()));
      else
        for(const auto &d : *n)
          cfg.sample.directions.push_back(parse_direction(d.as<std::string>()));
      }

    // Output section
    const YAML::Node &yo = doc["output"];
    if(yo)
      {
      OutputParameters &o = cfg.output;
      if(yo["directory"]) o.directory = yo["directory"].as<std::string>();
      if(yo["source-to-target-prefix"]) o.source_to_target_prefix = yo["source-to-target-prefix"].as<std::string>();
      if(yo["target-to-source-prefix"]) o.target_to_source_prefix = yo["target-to-source-prefix"].as<std::string>();
      if(yo["save-image-type"]) o.save_image_type = yo["save-image-type"].as<std::string>();
      if(yo["save-working-images"]) o.save_working_images = yo["save-working-images"].as<bool>();
      if(yo["downsample-tolerance"]) o.downsample_tolerance = yo["downsample-tolerance"].as<double>();
      if(yo["reuse-transforms"]) o.reuse_transforms = yo["reuse-transforms"].as<bool>();
      if(yo["target-template-output"]) o.target_template_output = yo["target-template-output"].as<std::string>();

      // Per-direction output selection
      const char *dir_names[] = { "source-to-target", "target-to-source" };
      DirectionOutputs *dir_out[] = { &o.source_to_target, &o.target_to_source };
      for(int k = 0; k < 2; k++)
        {
        std::string pfx = dir_names[k];
        if(yo[pfx + "-save-template"]) dir_out[k]->save_template = yo[pfx + "-save-template"].as<bool>();
        if(yo[pfx + "-save-images"]) dir_out[k]->save_images = yo[pfx + "-save-images"].as<bool>();
        if(yo[pfx + "-save-annotations"]) dir_out[k]->save_annotations = yo[pfx + "-save-annotations"].as<bool>();
        }
      if(yo["intensity-interpolation"])
        {
        std::string mode = yo["intensity-interpolation"].as<std::string>();
        if(mode == "linear")
          o.intensity_interpolation = INTERP_LINEAR;
        else if(mode == "bspline")
          o.intensity_interpolation = INTERP_BSPLINE;
        else
          throw AtlasRegException(AtlasRegException::InvalidSpec,
                                  "intensity-interpolation must be 'linear' or 'bspline', got '%s'",
                                  mode.c_str());
        }
      }
    cfg.output.directory = resolve_path(cfg.output.directory, base_dir);
    if(cfg.output.target_template_output.size())
      cfg.output.target_template_output = resolve_path(cfg.output.target_template_output, base_dir);

    // Engine section
    const YAML::Node &ye = doc["engine"];
    if(ye)
      {
      if(ye["greedy-executable"]) cfg.engine.greedy_executable = ye["greedy-executable"].as<std::string>();
      if(ye["threads"]) cfg.engine.threads = ye["threads"].as<int>();
      if(ye["work-directory"]) cfg.engine.work_directory = ye["work-directory"].as<std::string>();
      }
    if(cfg.engine.work_directory.size())
      cfg.engine.work_directory = resolve_path(cfg.engine.work_directory, base_dir);
    }
  catch(YAML::Exception &exc)
    {
    throw AtlasRegException(AtlasRegException::InvalidSpec,
                            "Malformed configuration document").SetCause(exc.what());
    }

  return cfg;
}

std::vector<SpecViolation>
AtlasRegConfiguration
::CollectViolations() const
{
  std::vector<SpecViolation> violations;

  for(const auto &kv : templates)
    check_template(kv.second, violations);

  for(size_t i = 0; i < atlases.size(); i++)
    {
    if(atlases[i].id == SAMPLE_ID)
      violations.push_back({"atlas identity 'sample' is reserved for the sample", false});
    CheckAtlasSpec(atlases[i], atlases, templates, violations);
    }

  // The sample has no parent and no templates of its own
  CheckAtlasSpec(sample.source, atlases, templates, violations);

  for(const auto &fn : sample.image_paths)
    if(fn.empty())
      violations.push_back({"sample: empty entry in images-path", false});

  for(int d : sample.directions)
    if(d == DIR_NONE)
      violations.push_back({"sample: directions must be 'forward', 'inverse' or 'both'", false});

  if(sample.target.empty())
    {
    violations.push_back({"sample: target is missing", false});
    }
  else if(!atlases.Has(sample.target))
    {
    violations.push_back({"sample: target atlas '" + sample.target + "' is not defined", false});
    }
  else if(sample.directions.size() > 1)
    {
    // Direction lists need one entry per step, count the steps if the chain is sound
    std::set<std::string> visited;
    const AtlasSpec *spec = &atlases.Get(sample.target);
    size_t n_steps = 1;
    bool sound = true;
    visited.insert(spec->id);
    while(spec->HasParent())
      {
      if(!atlases.Has(spec->parent) || visited.count(spec->parent))
        {
        sound = false;
        break;
        }
      spec = &atlases.Get(spec->parent);
      visited.insert(spec->id);
      n_steps++;
      }

    if(sound && n_steps != sample.directions.size())
      violations.push_back({"sample: directions lists " + std::to_string(sample.directions.size())
                            + " entries but the chain has " + std::to_string(n_steps) + " steps", false});
    }

  return violations;
}

void
AtlasRegConfiguration
::Validate() const
{
  if(atlases.Has(sample.target))
    {
    const AtlasSpec &target = atlases.Get(sample.target);
    if(!target.HasParent() && target.template_path.empty())
      throw AtlasRegException(AtlasRegException::EmptyChain,
                              "target atlas has no parent and no template").SetSpec(target.id);
    }

  ThrowIfViolations(CollectViolations(), "configuration");
}

std::vector<SpecViolation>
AtlasRegConfiguration
::CollectMissingFiles() const
{
  std::vector<SpecViolation> violations;
  CheckAtlasSpecFiles(sample.source, violations);
  for(const auto &fn : sample.image_paths)
    if(fn.size() && !itksys::SystemTools::FileExists(fn.c_str(), true))
      violations.push_back({"sample: images-path '" + fn + "' does not exist", false});

  // Walk the chain up to the root, stopping at a broken link or a loop
  std::set<std::string> visited;
  std::string id = sample.target;
  while(atlases.Has(id) && !visited.count(id))
    {
    const AtlasSpec &spec = atlases.Get(id);
    visited.insert(id);
    CheckAtlasSpecFiles(spec, violations);
    id = spec.parent;
    }

  return violations;
}

void
AtlasRegConfiguration
::ValidateFiles() const
{
  ThrowIfViolations(CollectMissingFiles(), "configuration files");
}

} // namespace atlasreg
