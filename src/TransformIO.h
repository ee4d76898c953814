#ifndef TRANSFORMIO_H
#define TRANSFORMIO_H

#include "TransformComposer.h"
#include "ChainResolver.h"
#include "AtlasRegStdOut.h"
#include <yaml-cpp/yaml.h>
#include <map>
#include <string>
#include <vector>

namespace atlasreg
{

/**
 * Persists step transforms in a directory, with a chain.yaml manifest that
 * lets a later run pick up steps that were already registered. Affine legs
 * are stored as greedy RAS matrices, deformable legs as displacement fields.
 */
template <typename TReal>
class TransformIO
{
public:
  ATLASREG_TYPEDEFS
  typedef TransformLeg<TReal> LegType;
  typedef TransformResult<TReal> ResultType;
  typedef ComposedTransform<TReal> ComposedType;

  /** Opens the directory, reading the manifest of a previous run if there is one */
  TransformIO(const std::string &directory, AtlasRegStdOut *out = nullptr);
  TransformIO(const TransformIO &) = delete;
  TransformIO &operator=(const TransformIO &) = delete;

  const std::string &GetDirectory() const { return m_Directory; }

  std::string GetManifestFile() const;

  /** File name (relative to the directory) of a leg or of its inverse */
  static std::string GetLegFileName(unsigned int step, const std::string &tmpl,
                                    typename LegType::Kind kind, bool inverse);

  /** Write the legs of a step and update the manifest, listing the templates it ran */
  void Save(const ResultType &result, const std::vector<std::string> &template_names);

  /**
   * Read back a step saved earlier. Succeeds only if the manifest entry has the
   * same specs and templates, was registered on the same working grids, and
   * all of its files exist. When the step wants its inverse, every deformable
   * leg of an invertible template must also have its inverse field.
   */
  bool Load(const RegistrationStep &step,
            const ImageGeometry &fixed_working, const ImageGeometry &moving_working,
            double tolerance, ResultType &result) const;

  /** List the legs of composed transforms, in application order */
  void WriteComposed(const std::vector<const ComposedType *> &composed,
                     const std::string &filename) const;

  size_t GetNumberOfEntries() const { return m_Entries.size(); }

  static YAML::Node GeometryToYAML(const ImageGeometry &geom);
  static ImageGeometry GeometryFromYAML(const YAML::Node &node);

private:
  void WriteManifest() const;

  static bool IsInvertibleTemplate(const RegistrationStep &step, const std::string &name);

  std::string m_Directory;
  std::map<unsigned int, YAML::Node> m_Entries;

  AtlasRegStdOut *m_StdOut;
  AtlasRegStdOut m_DefaultStdOut;
};

} // namespace atlasreg

#endif // TRANSFORMIO_H
