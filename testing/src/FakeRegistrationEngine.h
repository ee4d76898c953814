#ifndef FAKEREGISTRATIONENGINE_H
#define FAKEREGISTRATIONENGINE_H

#include "RegistrationEngine.h"
#include <string>
#include <vector>

namespace atlasreg
{

/**
 * Deterministic stand-in for the registration engine. Affine passes return a
 * fixed matrix and offset. Deformable passes return a constant displacement
 * field on the fixed grid and, when asked, its exact inverse on the same
 * grid. Every call is recorded, and the engine can be told to fail a call.
 */
template <typename TReal>
class FakeRegistrationEngine : public RegistrationEngine<TReal>
{
public:
  ATLASREG_TYPEDEFS
  typedef TransformLeg<TReal> LegType;

  struct CallRecord
  {
    std::string template_name;

    // Template names of the legs the pass was seeded with, in chain order
    std::vector<std::string> initial;
    bool want_inverse;
    itk::Size<3> fixed_size, moving_size;
  };

  FakeRegistrationEngine()
    : m_FailAtCall(0)
  {
    m_Matrix.SetIdentity();
    m_Offset.Fill(0.0);
    m_Displacement.Fill(0.0);
  }

  /** Make the given call (counting from 1) report a divergence, 0 disables */
  void SetFailAtCall(unsigned int call) { m_FailAtCall = call; }

  void SetAffine(const typename TAffineTransform::MatrixType &matrix,
                 const typename TAffineTransform::OutputVectorType &offset)
  {
    m_Matrix = matrix;
    m_Offset = offset;
  }

  void SetDisplacement(const itk::Vector<double, 3> &disp) { m_Displacement = disp; }

  size_t GetNumberOfCalls() const { return m_Calls.size(); }

  const std::vector<CallRecord> &GetCalls() const { return m_Calls; }

  static typename TDisplacementField::Pointer MakeConstantField(
      const itk::ImageBase<3> *grid, const itk::Vector<double, 3> &disp)
  {
    typename TDisplacementField::Pointer field = TDisplacementField::New();
    field->SetRegions(grid->GetLargestPossibleRegion());
    field->SetSpacing(grid->GetSpacing());
    field->SetOrigin(grid->GetOrigin());
    field->SetDirection(grid->GetDirection());
    field->Allocate();

    typename TDisplacementField::PixelType v;
    for(unsigned int d = 0; d < 3; d++)
      v[d] = disp[d];
    field->FillBuffer(v);
    return field;
  }

  virtual int Register(TImage3D *fixed, TImage3D *moving,
                       const TransformTemplate &tmpl,
                       const std::vector<LegType> &initial,
                       bool want_inverse,
                       LegType &out_leg,
                       std::string &log) override
  {
    CallRecord rec;
    rec.template_name = tmpl.name;
    for(const auto &leg : initial)
      rec.initial.push_back(leg.template_name);
    rec.want_inverse = want_inverse;
    rec.fixed_size = fixed->GetLargestPossibleRegion().GetSize();
    rec.moving_size = moving->GetLargestPossibleRegion().GetSize();
    m_Calls.push_back(rec);

    log += "fake engine: pass " + tmpl.name + ", call " + std::to_string(m_Calls.size()) + "\n";
    if(m_Calls.size() == m_FailAtCall)
      {
      log += "fake engine: optimization diverged\n";
      return 1;
      }

    if(tmpl.type == TransformTemplate::AFFINE)
      {
      out_leg.kind = LegType::AFFINE;
      out_leg.affine = TAffineTransform::New();
      out_leg.affine->SetMatrix(m_Matrix);
      out_leg.affine->SetOffset(m_Offset);
      }
    else
      {
      itk::Vector<double, 3> neg = -m_Displacement;
      out_leg.kind = LegType::DEFORMABLE;
      out_leg.warp = MakeConstantField(fixed, m_Displacement);
      if(want_inverse)
        out_leg.inverse_warp = MakeConstantField(fixed, neg);
      }

    log += "fake engine: converged\n";
    return 0;
  }

private:
  unsigned int m_FailAtCall;
  typename TAffineTransform::MatrixType m_Matrix;
  typename TAffineTransform::OutputVectorType m_Offset;
  itk::Vector<double, 3> m_Displacement;
  std::vector<CallRecord> m_Calls;
};

} // namespace atlasreg

#endif // FAKEREGISTRATIONENGINE_H
