#pragma once

#include <stdexcept>
#include <string>

namespace labormodel
{
  // The macro prior for a cell is absent or unusable. The cell is skipped.
  class MissingPriorException : public std::runtime_error
  {
  public:
  MissingPriorException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~MissingPriorException()
      {}
  };

  class PersistenceException : public std::runtime_error
  {
  public:
  PersistenceException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~PersistenceException()
      {}
  };

  class EngineConfigurationException : public std::runtime_error
  {
  public:
  EngineConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~EngineConfigurationException()
      {}
  };

  // Malformed or unreadable input file (prior table, evidence, directory...).
  class EvidenceFileException : public std::runtime_error
  {
  public:
  EvidenceFileException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~EvidenceFileException()
      {}
  };
}
