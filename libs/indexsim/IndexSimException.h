// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_INDEXSIM_EXCEPTION_H
#define __TAO_INDEX_INDEXSIM_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace tao_index
{
  class IndexSimException : public std::runtime_error
  {
  public:
    IndexSimException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~IndexSimException() = default;
  };

  // Raised when the snapshot sequence cannot support any simulation
  // (empty, no emissions at all, out of order).
  class SnapshotLoaderException : public IndexSimException
  {
  public:
    explicit SnapshotLoaderException(const std::string& msg)
      : IndexSimException(msg) {}
  };

  // Fewer than two usable snapshots. Raised by the loader and by a
  // single cadence run; the analyzer drops the affected cadence.
  class InsufficientDataException : public SnapshotLoaderException
  {
  public:
    explicit InsufficientDataException(const std::string& msg)
      : SnapshotLoaderException(msg) {}
  };

  class SimulationCancelledException : public IndexSimException
  {
  public:
    explicit SimulationCancelledException(const std::string& msg)
      : IndexSimException(msg) {}
  };

  class IndexPortfolioException : public IndexSimException
  {
  public:
    explicit IndexPortfolioException(const std::string& msg)
      : IndexSimException(msg) {}
  };

  class WeightScheduleException : public IndexSimException
  {
  public:
    explicit WeightScheduleException(const std::string& msg)
      : IndexSimException(msg) {}
  };

  class RebalanceConfigurationException : public IndexSimException
  {
  public:
    explicit RebalanceConfigurationException(const std::string& msg)
      : IndexSimException(msg) {}
  };

  class ComparativeAnalyzerException : public IndexSimException
  {
  public:
    explicit ComparativeAnalyzerException(const std::string& msg)
      : IndexSimException(msg) {}
  };
} // namespace tao_index

#endif // __TAO_INDEX_INDEXSIM_EXCEPTION_H
