#ifndef LANDMARKIO_H
#define LANDMARKIO_H

#include "AtlasSpec.h"
#include "AtlasRegTools.h"
#include <vtkSmartPointer.h>
#include <map>
#include <string>
#include <vector>

class vtkPolyData;

namespace atlasreg
{

typedef std::map<std::string, std::vector<ReferencePoint> > LandmarkSets;

/**
 * Build a vertex polydata from reference points. Points are placed at their
 * physical (LPS) position in the grid; the pixel coordinates are kept in the
 * "pixel" point array and the names in the "name" array.
 */
vtkSmartPointer<vtkPolyData> MakeLandmarkPolyData(const std::vector<ReferencePoint> &points,
                                                  const ImageGeometry &grid);

void WriteLandmarks(const std::vector<ReferencePoint> &points, const ImageGeometry &grid,
                    const char *fname);

vtkSmartPointer<vtkPolyData> ReadVTKPolyData(const char *fname);

/** Write named point sets as a YAML table of pixel coordinates */
void WriteLandmarkTable(const LandmarkSets &sets, const char *fname);

} // namespace atlasreg

#endif // LANDMARKIO_H
