/*=========================================================================

  Program:   AtlasReg atlas registration chain orchestrator
  Language:  C++

  AtlasReg is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  AtlasReg is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with AtlasReg.  If not, see <http://www.gnu.org/licenses/>.

=========================================================================*/
#ifndef ATLASREGEXCEPTION_H
#define ATLASREGEXCEPTION_H

#include <exception>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdarg>

namespace atlasreg
{

/**
 * Exception thrown by the orchestrator. Carries the error category and the
 * context needed to reproduce a failure: the chain step, the atlas spec
 * identities involved, the underlying cause and, for validation failures,
 * the full list of violations found.
 */
class AtlasRegException : public std::exception
{
public:

  enum ErrorType {
    InvalidSpec = 0,
    CyclicChain,
    EmptyChain,
    UnsupportedDownsample,
    RegistrationFailed,
    NoInverseAvailable,
    GridMismatch
  };

  AtlasRegException(ErrorType type, const char *format, ...)
    : m_Type(type), m_Step(-1)
  {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    m_Message = buffer;
    UpdateWhat();
  }

  virtual ~AtlasRegException() {}

  virtual const char *what() const noexcept override
  {
    return m_What.c_str();
  }

  AtlasRegException &SetStep(int step)
  {
    m_Step = step;
    UpdateWhat();
    return *this;
  }

  AtlasRegException &SetSpec(const std::string &spec)
  {
    m_Specs.clear();
    m_Specs.push_back(spec);
    UpdateWhat();
    return *this;
  }

  AtlasRegException &SetSpec(const std::string &moving, const std::string &fixed)
  {
    m_Specs.clear();
    m_Specs.push_back(moving);
    m_Specs.push_back(fixed);
    UpdateWhat();
    return *this;
  }

  AtlasRegException &SetCause(const std::string &cause)
  {
    m_Cause = cause;
    UpdateWhat();
    return *this;
  }

  AtlasRegException &SetViolations(const std::vector<std::string> &violations)
  {
    m_Violations = violations;
    UpdateWhat();
    return *this;
  }

  ErrorType GetType() const { return m_Type; }
  int GetStep() const { return m_Step; }
  const std::vector<std::string> &GetSpecs() const { return m_Specs; }
  const std::string &GetCause() const { return m_Cause; }
  const std::string &GetMessage() const { return m_Message; }
  const std::vector<std::string> &GetViolations() const { return m_Violations; }

  static const char *GetErrorTypeName(ErrorType type)
  {
    switch(type)
      {
      case InvalidSpec: return "InvalidSpec";
      case CyclicChain: return "CyclicChain";
      case EmptyChain: return "EmptyChain";
      case UnsupportedDownsample: return "UnsupportedDownsample";
      case RegistrationFailed: return "RegistrationFailed";
      case NoInverseAvailable: return "NoInverseAvailable";
      case GridMismatch: return "GridMismatch";
      }
    return "Unknown";
  }

private:

  void UpdateWhat()
  {
    m_What = std::string("[") + GetErrorTypeName(m_Type) + "] ";
    if(m_Step >= 0)
      m_What += "step " + std::to_string(m_Step) + ": ";

    if(m_Specs.size() == 1)
      m_What += "(" + m_Specs[0] + ") ";
    else if(m_Specs.size() == 2)
      m_What += "(" + m_Specs[0] + " -> " + m_Specs[1] + ") ";

    m_What += m_Message;

    if(m_Cause.size())
      m_What += "; cause: " + m_Cause;

    for(const auto &v : m_Violations)
      m_What += "\n  - " + v;
  }

  ErrorType m_Type;
  int m_Step;
  std::vector<std::string> m_Specs;
  std::string m_Message, m_Cause, m_What;
  std::vector<std::string> m_Violations;
};

} // namespace atlasreg

#endif // ATLASREGEXCEPTION_H
