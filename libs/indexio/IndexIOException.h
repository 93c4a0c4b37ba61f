// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_INDEXIO_EXCEPTION_H
#define __TAO_INDEX_INDEXIO_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace tao_index
{
  class IndexIOException : public std::runtime_error
  {
  public:
    IndexIOException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~IndexIOException() = default;
  };

  class EmissionSnapshotReaderException : public IndexIOException
  {
  public:
    EmissionSnapshotReaderException(const std::string msg)
      : IndexIOException(msg)
    {}
  };

  class ConfigurationFileReaderException : public IndexIOException
  {
  public:
    ConfigurationFileReaderException(const std::string msg)
      : IndexIOException(msg)
    {}
  };

  class WeightScheduleReaderException : public IndexIOException
  {
  public:
    WeightScheduleReaderException(const std::string msg)
      : IndexIOException(msg)
    {}
  };

  class ReportWriterException : public IndexIOException
  {
  public:
    ReportWriterException(const std::string msg)
      : IndexIOException(msg)
    {}
  };
} // namespace tao_index

#endif
