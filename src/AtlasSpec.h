#ifndef ATLASSPEC_H
#define ATLASSPEC_H

#include "AtlasRegParameters.h"
#include <string>
#include <vector>
#include <map>
#include <array>

namespace YAML
{
class Node;
}

namespace atlasreg
{

/** Registration directions requested for a chain step (bit flags) */
enum Direction { DIR_NONE = 0, DIR_FORWARD = 1, DIR_INVERSE = 2, DIR_BOTH = 3 };

/** Named landmark given as a pixel coordinate, e.g. bregma */
struct ReferencePoint
{
  std::string name;
  std::array<double, 3> pixel;
};

/**
 * One node of an atlas hierarchy. Constructed once from the configuration
 * document and not modified afterwards. The parent is referenced by identity,
 * and is looked up in the AtlasSpecRegistry that owns all specs of a run.
 */
struct AtlasSpec
{
  std::string id;
  std::string template_path;
  std::vector<std::string> annotation_paths;

  // Index-aligned with annotation_paths, or empty
  std::vector<std::string> structure_tree_paths;

  // Physical resolution in micrometers and pixel size, one entry per axis
  std::vector<double> resolution;
  std::vector<long> size;

  std::vector<ReferencePoint> reference_points;
  std::string structure;
  std::string orientation;

  // Identity of the parent atlas, empty for a root atlas
  std::string parent;

  // Downsampling requested for registration into this atlas
  double downsampling = 1.0;
  bool downsampling_auto = false;
  bool downsampling_explicit = false;

  // Names of the transform templates used to register into this atlas
  std::vector<std::string> transforms;

  // Optional filter pipeline applied to the working image, e.g. "M,1,1,1"
  std::string prefilter;

  bool HasParent() const { return parent.size() > 0; }

  double GetMeanResolution() const;
};

/** A named registration pass configuration (affine or deformable) */
struct TransformTemplate
{
  enum Type { AFFINE = 0, DEFORMABLE, INVALID };

  std::string name;
  Type type = AFFINE;
  int dof = 12;
  std::string metric = "NMI";
  std::vector<int> metric_radius;
  std::vector<int> iterations { 100, 50, 10 };
  bool invertible = true;

  // Extra engine options, appended verbatim to the engine command
  std::string options;

  static const char *GetTypeName(Type type);
};

using TransformTemplateMap = std::map<std::string, TransformTemplate>;

/** The subject being registered into the atlas hierarchy */
struct SampleSpec
{
  // Source template and annotations of the sample, with id "sample"
  AtlasSpec source;

  // Additional intensity images sharing the source template grid
  std::vector<std::string> image_paths;

  // Identity of the atlas to register into
  std::string target;

  // One entry for all steps, or one entry per step
  std::vector<int> directions { DIR_BOTH };

  int GetDirections(unsigned int step) const;
};

/** A single problem found during validation */
struct SpecViolation
{
  std::string message;
  bool cyclic;
};

/**
 * Owns every AtlasSpec of a run, addressed by identity or by index.
 */
class AtlasSpecRegistry
{
public:
  void Add(const AtlasSpec &spec);

  bool Has(const std::string &id) const
  { return m_Index.find(id) != m_Index.end(); }

  const AtlasSpec &Get(const std::string &id) const;

  size_t GetIndex(const std::string &id) const;

  size_t size() const { return m_Specs.size(); }

  const AtlasSpec &operator[](size_t i) const { return m_Specs.at(i); }

  /**
   * Return the parent of a spec, or nullptr for a root atlas. The whole
   * ancestry of the spec is walked with a visited set, so that a cycle
   * anywhere above the spec is reported as CyclicChain.
   */
  const AtlasSpec *ResolveParent(const AtlasSpec &spec) const;

private:
  std::vector<AtlasSpec> m_Specs;
  std::map<std::string, size_t> m_Index;
};

/** Append every violation of the AtlasSpec invariants to the list */
void CheckAtlasSpec(const AtlasSpec &spec,
                    const AtlasSpecRegistry &registry,
                    const TransformTemplateMap &templates,
                    std::vector<SpecViolation> &violations);

/** Append a violation for every template, annotation or structure tree file that does not exist */
void CheckAtlasSpecFiles(const AtlasSpec &spec, std::vector<SpecViolation> &violations);

/** Validate one spec, throwing with all of its violations */
void ValidateAtlasSpec(const AtlasSpec &spec,
                       const AtlasSpecRegistry &registry,
                       const TransformTemplateMap &templates);

/** Throw InvalidSpec or CyclicChain listing all violations, if there are any */
void ThrowIfViolations(const std::vector<SpecViolation> &violations, const char *what);

/**
 * Contents of a run configuration document
 */
class AtlasRegConfiguration
{
public:
  SampleSpec sample;
  AtlasSpecRegistry atlases;
  TransformTemplateMap templates;
  OutputParameters output;
  EngineParameters engine;

  // Directory of the document, against which relative paths are resolved
  std::string base_dir;

  /** Read a configuration document from disk */
  static AtlasRegConfiguration Load(const std::string &filename);

  /** Read a configuration from an already parsed document. The document is not modified */
  static AtlasRegConfiguration FromYAML(const YAML::Node &doc, const std::string &base_dir);

  /**
   * Read one atlas spec. Keys may be given plainly or with the 'target-', 'ccf-'
   * or 'source-' prefixes of standalone atlas parameter files.
   */
  static AtlasSpec LoadAtlasSpec(const YAML::Node &node, const std::string &id,
                                 const std::string &base_dir);

  /**
   * Write an atlas spec as a standalone atlas parameter file with 'target-'
   * keys, paths relative to the file, as read back by LoadAtlasSpec
   */
  static void SaveAtlasSpec(const AtlasSpec &spec, const std::string &filename);

  /** Built-in 'affine' and 'bspline' templates */
  static TransformTemplateMap GetDefaultTemplates();

  /** Collect every violation in the sample, the atlases and the templates */
  std::vector<SpecViolation> CollectViolations() const;

  /**
   * Throws if CollectViolations reports anything. A target atlas with neither
   * a parent nor a template is reported as EmptyChain.
   */
  void Validate() const;

  /**
   * Files of the sample and of every atlas on the sample's chain that do not
   * exist. Atlases the chain does not reach are not checked.
   */
  std::vector<SpecViolation> CollectMissingFiles() const;

  /** Throws InvalidSpec if CollectMissingFiles reports anything */
  void ValidateFiles() const;
};

} // namespace atlasreg

#endif // ATLASSPEC_H
