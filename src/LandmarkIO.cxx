#include "LandmarkIO.h"
#include "AtlasRegException.h"

#include <vtkPolyData.h>
#include <vtkPolyDataReader.h>
#include <vtkPolyDataWriter.h>
#include <vtkPoints.h>
#include <vtkCellArray.h>
#include <vtkDoubleArray.h>
#include <vtkStringArray.h>
#include <vtkPointData.h>
#include <vtkNew.h>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace atlasreg
{

vtkSmartPointer<vtkPolyData> MakeLandmarkPolyData(const std::vector<ReferencePoint> &points,
                                                  const ImageGeometry &grid)
{
  vtkNew<vtkPoints> pts;
  vtkNew<vtkCellArray> verts;

  vtkSmartPointer<vtkDoubleArray> pix_array = vtkNew<vtkDoubleArray>();
  pix_array->SetNumberOfComponents(3);
  pix_array->SetName("pixel");

  vtkSmartPointer<vtkStringArray> name_array = vtkNew<vtkStringArray>();
  name_array->SetName("name");

  for(const auto &rp : points)
    {
    itk::ContinuousIndex<double, 3> idx;
    for(unsigned int d = 0; d < 3; d++)
      idx[d] = rp.pixel[d];
    itk::Point<double, 3> x = grid.IndexToPhysical(idx);

    vtkIdType id = pts->InsertNextPoint(x[0], x[1], x[2]);
    verts->InsertNextCell(1, &id);
    pix_array->InsertNextTuple(rp.pixel.data());
    name_array->InsertNextValue(rp.name);
    }

  vtkSmartPointer<vtkPolyData> pd = vtkNew<vtkPolyData>();
  pd->SetPoints(pts);
  pd->SetVerts(verts);
  pd->GetPointData()->AddArray(pix_array);
  pd->GetPointData()->AddArray(name_array);
  return pd;
}

void WriteLandmarks(const std::vector<ReferencePoint> &points, const ImageGeometry &grid,
                    const char *fname)
{
  vtkSmartPointer<vtkPolyData> pd = MakeLandmarkPolyData(points, grid);
  vtkSmartPointer<vtkPolyDataWriter> writer = vtkSmartPointer<vtkPolyDataWriter>::New();
  writer->SetFileName(fname);
  writer->SetInputData(pd);
  if(!writer->Write())
    throw AtlasRegException(AtlasRegException::InvalidSpec, "Unable to write landmarks to %s", fname);
}

vtkSmartPointer<vtkPolyData> ReadVTKPolyData(const char *fname)
{
  vtkSmartPointer<vtkPolyDataReader> reader = vtkSmartPointer<vtkPolyDataReader>::New();
  reader->SetFileName(fname);
  reader->Update();
  return reader->GetOutput();
}

void WriteLandmarkTable(const LandmarkSets &sets, const char *fname)
{
  YAML::Node doc;
  for(const auto &it : sets)
    {
    YAML::Node set(YAML::NodeType::Map);
    for(const auto &rp : it.second)
      {
      YAML::Node p;
      p["x"] = rp.pixel[0];
      p["y"] = rp.pixel[1];
      p["z"] = rp.pixel[2];
      p.SetStyle(YAML::EmitterStyle::Flow);
      set[rp.name] = p;
      }
    doc[it.first] = set;
    }

  std::ofstream out(fname);
  if(!out)
    throw AtlasRegException(AtlasRegException::InvalidSpec, "Cannot write %s", fname);
  out << doc << std::endl;
}

} // namespace atlasreg
