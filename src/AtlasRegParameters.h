#ifndef ATLASREGPARAMETERS_H
#define ATLASREGPARAMETERS_H

#include "AtlasRegStdOut.h"
#include "AtlasRegCommon.h"
#include <string>

namespace atlasreg
{

/** Where and how run outputs are written */
/** Outputs written for one direction of the chain */
struct DirectionOutputs
{
  bool save_template = true;
  bool save_images = true;
  bool save_annotations = true;
};

struct OutputParameters
{
  std::string directory = "atlasreg";

  // Filename prefixes of forward and inverse outputs
  std::string source_to_target_prefix = "tar_";
  std::string target_to_source_prefix = "src_";

  // Extension of written images, without the leading dot
  std::string save_image_type = "nii.gz";

  bool save_working_images = false;
  InterpolationMode intensity_interpolation = INTERP_LINEAR;

  // Tolerance (voxels) used when checking that a downsampling factor
  // relates the sampling grids evenly, and when comparing image grids
  double downsample_tolerance = 0.01;

  bool reuse_transforms = true;

  DirectionOutputs source_to_target;
  DirectionOutputs target_to_source;

  // Atlas parameter file describing the registered sample, not written if empty
  std::string target_template_output;
};

/** Settings of the external registration engine */
struct EngineParameters
{
  std::string greedy_executable = "greedy";

  // Number of threads passed to the engine, 0 leaves the engine default
  int threads = 0;

  // Directory for engine inputs and outputs, defaults to <output>/engine
  std::string work_directory;
};

/** Run-level parameters, mostly from the command line */
struct AtlasRegParameters
{
  std::string fn_parameters;

  // Overrides of the configuration document, empty when not given
  std::string output_dir_override;
  std::string greedy_executable_override;
  int threads_override = -1;

  bool dry_run = false;
  bool no_reuse = false;
  bool flag_float_math = false;

  AtlasRegStdOut::Verbosity verbosity = AtlasRegStdOut::VERB_DEFAULT;
};

} // namespace atlasreg

#endif // ATLASREGPARAMETERS_H
